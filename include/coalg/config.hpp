#ifndef COALG_CONFIG_HPP
#define COALG_CONFIG_HPP

#define COALG_VERSION_MAJOR 0
#define COALG_VERSION_MINOR 3
#define COALG_VERSION_PATCH 0

#define COALG_VERSION (COALG_VERSION_MAJOR * 10000 + COALG_VERSION_MINOR * 100 + COALG_VERSION_PATCH)

// Evaluation strategy used by Cofree when none is given. Define before
// including any coalg header to make cofree tails lazy by default.
#ifndef COALG_DEFAULT_EVALUATION
#define COALG_DEFAULT_EVALUATION ::coalg::eager
#endif

#endif
