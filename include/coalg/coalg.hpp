#ifndef COALG_COALG_HPP
#define COALG_COALG_HPP

#include <coalg/config.hpp>

#include <coalg/algebra.hpp>
#include <coalg/capability.hpp>
#include <coalg/evaluation.hpp>
#include <coalg/foldable.hpp>
#include <coalg/tag.hpp>

#include <coalg/shape/choice.hpp>
#include <coalg/shape/identity.hpp>
#include <coalg/shape/lifted.hpp>
#include <coalg/shape/non_empty.hpp>
#include <coalg/shape/optional.hpp>
#include <coalg/shape/pair.hpp>
#include <coalg/shape/vector.hpp>

#include <coalg/cofree.hpp>
#include <coalg/cofree_instances.hpp>
#include <coalg/free.hpp>
#include <coalg/natural.hpp>
#include <coalg/show.hpp>
#include <coalg/zap.hpp>

#endif
