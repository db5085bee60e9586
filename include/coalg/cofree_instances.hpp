#ifndef COALG_COFREE_INSTANCES_HPP
#define COALG_COFREE_INSTANCES_HPP

#include <coalg/algebra.hpp>
#include <coalg/capability.hpp>
#include <coalg/cofree.hpp>
#include <coalg/evaluation.hpp>
#include <coalg/foldable.hpp>
#include <coalg/shape/lifted.hpp>
#include <coalg/tag.hpp>

#include <boost/optional.hpp>

#include <stdexcept>
#include <type_traits>
#include <vector>

namespace coalg {

    // Instances for Cofree<S, _, E>. Each struct is one way of deriving a
    // capability from what S can do; the specialisations at the end of this
    // file pick the most specific one S allows.

    template <typename S, typename E>
    struct CofreeComonad {
        template <typename A>
        static const A& copoint(const Cofree<S, A, E>& p) {
            return p.head();
        }

        template <typename A>
        static Cofree<S, Cofree<S, A, E>, E> cojoin(const Cofree<S, A, E>& a) {
            return a.duplicate();
        }

        template <typename A, typename F>
        static Cofree<S, result_t<F, const A&>, E> map(const Cofree<S, A, E>& fa, F f) {
            return fa.map(f);
        }

        template <typename A, typename F>
        static Cofree<S, result_t<F, const Cofree<S, A, E>&>, E> cobind(const Cofree<S, A, E>& fa, F f) {
            return fa.extend(f);
        }
    };

    // Needs only Foldable S. Every cofree has a head, so the result is
    // always a Foldable1.
    template <typename S, typename E>
    struct CofreeFoldable : FoldableOps<CofreeFoldable<S, E>> {
        template <typename A, typename F>
        static result_t<F, const A&> fold_map(const Cofree<S, A, E>& fa, F f) {
            typedef result_t<F, const A&> B;
            B h = f(fa.head());
            return Monoid<B>::append(h, Foldable<S>::fold_map(fa.tail(), [f](const Cofree<S, A, E>& c) {
                return fold_map(c, f);
            }));
        }

        template <typename A, typename B, typename F>
        static B fold_right(const Cofree<S, A, E>& fa, B z, F f) {
            B rest = Foldable<S>::fold_right(fa.tail(), z, [f](const Cofree<S, A, E>& c, const B& acc) {
                return fold_right(c, acc, f);
            });
            return f(fa.head(), rest);
        }

        template <typename A, typename B, typename F>
        static B fold_left(const Cofree<S, A, E>& fa, B z, F f) {
            return Foldable<S>::fold_left(fa.tail(), f(z, fa.head()), [f](const B& acc, const Cofree<S, A, E>& c) {
                return fold_left(c, acc, f);
            });
        }

        template <typename A, typename Z, typename F>
        static result_t<Z, const A&> fold_map_left1(const Cofree<S, A, E>& fa, Z z, F f) {
            typedef result_t<Z, const A&> B;
            return Foldable<S>::fold_left(fa.tail(), z(fa.head()), [f](const B& acc, const Cofree<S, A, E>& c) {
                return fold_left(c, acc, f);
            });
        }

        template <typename A, typename Z, typename F>
        static result_t<Z, const A&> fold_map_right1(const Cofree<S, A, E>& fa, Z z, F f) {
            typedef result_t<Z, const A&> B;
            boost::optional<B> r = fold_right(fa, boost::optional<B>(), [z, f](const A& a, const boost::optional<B>& acc) {
                if (!acc)
                    return boost::optional<B>(z(a));
                return boost::optional<B>(f(a, *acc));
            });
            if (!r)
                throw std::logic_error("fold_map_right1: the branching Foldable reported no element");
            return *r;
        }

        template <typename A, typename F>
        static result_t<F, const A&> fold_map1(const Cofree<S, A, E>& fa, F f) {
            typedef result_t<F, const A&> B;
            B h = f(fa.head());
            boost::optional<B> t = Foldable<S>::fold_map1_opt(fa.tail(), [f](const Cofree<S, A, E>& c) {
                return fold_map1(c, f);
            });
            return t ? Semigroup<B>::append(h, *t) : h;
        }

        template <typename A, typename F>
        static A fold_left1(const Cofree<S, A, E>& fa, F f) {
            return fold_map_left1(fa, [](const A& a) { return a; }, f);
        }

        template <typename A, typename F>
        static A fold_right1(const Cofree<S, A, E>& fa, F f) {
            return fold_map_right1(fa, [](const A& a) { return a; }, f);
        }
    };

    // Foldable1 S: the children fold without the empty case.
    template <typename S, typename E>
    struct CofreeFoldable1 : CofreeFoldable<S, E> {
        template <typename A, typename F>
        static result_t<F, const A&> fold_map1(const Cofree<S, A, E>& fa, F f) {
            typedef result_t<F, const A&> B;
            B h = f(fa.head());
            return Semigroup<B>::append(h, Foldable1<S>::fold_map1(fa.tail(), [f](const Cofree<S, A, E>& c) {
                return fold_map1(c, f);
            }));
        }
    };

    // Needs only Traverse S. traverse1 runs the children in
    // apply_applicative<G> so that a node without children never needs a
    // point in G.
    template <typename S, typename E>
    struct CofreeTraverse : CofreeComonad<S, E> {
        template <typename G, typename A, typename F>
        static apply_t<G, Cofree<S, value_type_t<result_t<F, const A&>>, E>> traverse(const Cofree<S, A, E>& fa, F f) {
            typedef value_type_t<result_t<F, const A&>> B;
            typedef Cofree<S, B, E> result_type;
            typedef typename result_type::tail_type tail_type;
            result_t<F, const A&> h = f(fa.head());
            return Applicative<G>::apply2(h, Traverse<S>::template traverse<G>(fa.tail(), [f](const Cofree<S, A, E>& c) {
                return traverse<G>(c, f);
            }), [](const B& b, const tail_type& t) { return result_type(b, t); });
        }

        template <typename G, typename A, typename F>
        static apply_t<G, Cofree<S, value_type_t<result_t<F, const A&>>, E>> traverse1(const Cofree<S, A, E>& fa, F f) {
            typedef value_type_t<result_t<F, const A&>> B;
            typedef Cofree<S, B, E> result_type;
            typedef typename result_type::tail_type tail_type;
            result_t<F, const A&> h = f(fa.head());
            Lifted<G, tail_type> t = Traverse<S>::template traverse<apply_applicative<G>>(fa.tail(), [f](const Cofree<S, A, E>& c) {
                return Lifted<G, result_type>::effect(traverse1<G>(c, f));
            });
            if (t.is_pure()) {
                tail_type tl = t.pure_value();
                return Apply<G>::map(h, [tl](const B& b) { return result_type(b, tl); });
            }
            return Apply<G>::apply2(h, t.effect_value(), [](const B& b, const tail_type& tl) { return result_type(b, tl); });
        }
    };

    // Traverse1 S: the children traverse in G directly.
    template <typename S, typename E>
    struct CofreeTraverse1 : CofreeTraverse<S, E> {
        template <typename G, typename A, typename F>
        static apply_t<G, Cofree<S, value_type_t<result_t<F, const A&>>, E>> traverse1(const Cofree<S, A, E>& fa, F f) {
            typedef value_type_t<result_t<F, const A&>> B;
            typedef Cofree<S, B, E> result_type;
            typedef typename result_type::tail_type tail_type;
            result_t<F, const A&> h = f(fa.head());
            return Apply<G>::apply2(h, Traverse1<S>::template traverse1<G>(fa.tail(), [f](const Cofree<S, A, E>& c) {
                return traverse1<G>(c, f);
            }), [](const B& b, const tail_type& t) { return result_type(b, t); });
        }
    };

    // Plus S: bind keeps the head of f(head) and puts its branches before
    // the rebound original branches.
    template <typename S, typename E>
    struct CofreeBind : CofreeComonad<S, E> {
        template <typename A, typename F>
        static result_t<F, const A&> bind(const Cofree<S, A, E>& fa, F f) {
            typedef result_t<F, const A&> result_type;
            result_type r = f(fa.head());
            return result_type::suspend(r.head(), [r, fa, f]() {
                return Plus<S>::plus(r.tail(), Functor<S>::map(fa.tail(), [f](const Cofree<S, A, E>& c) {
                    return bind(c, f);
                }));
            });
        }

        template <typename A, typename Fn>
        static Cofree<S, result_t<Fn, const A&>, E> ap(const Cofree<S, A, E>& fa, const Cofree<S, Fn, E>& ff) {
            return bind(ff, [fa](const Fn& g) { return fa.map(g); });
        }

        template <typename A, typename B, typename F>
        static Cofree<S, result_t<F, const A&, const B&>, E> apply2(const Cofree<S, A, E>& fa, const Cofree<S, B, E>& fb, F f) {
            return bind(fa, [fb, f](const A& a) {
                return fb.map([a, f](const B& b) { return f(a, b); });
            });
        }
    };

    // PlusEmpty S: point is a single node with empty branching.
    template <typename S, typename E>
    struct CofreeMonad : CofreeBind<S, E> {
        template <typename A>
        static Cofree<S, A, E> point(A a) {
            return Cofree<S, A, E>(a, PlusEmpty<S>::template empty<Cofree<S, A, E>>());
        }
    };

    template <typename S, typename E>
    struct CofreeZipFunctor {
        template <typename A, typename F>
        static CofreeZip<S, result_t<F, const A&>, E> map(const CofreeZip<S, A, E>& fa, F f) {
            return tag<zip_tag>(fa.untag().map(f));
        }
    };

    // Apply S: heads combine with heads, branchings through Apply S.
    template <typename S, typename E>
    struct CofreeZipApply : CofreeZipFunctor<S, E> {
        template <typename A, typename B, typename F>
        static CofreeZip<S, result_t<F, const A&, const B&>, E> apply2(
            const CofreeZip<S, A, E>& fa, const CofreeZip<S, B, E>& fb, F f) {
            return tag<zip_tag>(zip_nodes(fa.untag(), fb.untag(), f));
        }

        template <typename A, typename Fn>
        static CofreeZip<S, result_t<Fn, const A&>, E> ap(
            const CofreeZip<S, A, E>& fa, const CofreeZip<S, Fn, E>& ff) {
            return apply2(fa, ff, [](const A& a, const Fn& g) { return g(a); });
        }

    private:
        template <typename A, typename B, typename F>
        static Cofree<S, result_t<F, const A&, const B&>, E> zip_nodes(const Cofree<S, A, E>& a, const Cofree<S, B, E>& b, F f) {
            typedef Cofree<S, result_t<F, const A&, const B&>, E> result_type;
            return result_type::suspend(f(a.head(), b.head()), [a, b, f]() {
                return Apply<S>::apply2(a.tail(), b.tail(), [f](const Cofree<S, A, E>& x, const Cofree<S, B, E>& y) {
                    return zip_nodes(x, y, f);
                });
            });
        }
    };

    // Applicative S: point repeats a value through an infinite tree, so it
    // only exists for lazy cofrees.
    template <typename S, typename E>
    struct CofreeZipApplicative : CofreeZipApply<S, E> {
        static_assert(is_lazy<E>::value, "a zipping point is infinite and needs lazy evaluation");

        template <typename A>
        static CofreeZip<S, A, E> point(A a) {
            return tag<zip_tag>(repeat(a));
        }

    private:
        template <typename A>
        static Cofree<S, A, E> repeat(A a) {
            return Cofree<S, A, E>::suspend(a, [a]() { return Applicative<S>::point(repeat(a)); });
        }
    };

    template <typename S, typename E>
    struct CofreeEqual {
        template <typename A, typename Eq>
        static bool equal(const Cofree<S, A, E>& a, const Cofree<S, A, E>& b, Eq eq) {
            if (!eq(a.head(), b.head()))
                return false;
            return Equal<S>::equal(a.tail(), b.tail(), [eq](const Cofree<S, A, E>& x, const Cofree<S, A, E>& y) {
                return equal(x, y, eq);
            });
        }
    };

    template <typename S, typename E>
    struct CofreeZipEqual {
        template <typename A, typename Eq>
        static bool equal(const CofreeZip<S, A, E>& a, const CofreeZip<S, A, E>& b, Eq eq) {
            return CofreeEqual<S, E>::equal(a.untag(), b.untag(), eq);
        }
    };

    template <typename S, typename A, typename E>
    typename std::enable_if<is_equal<S>::value, bool>::type
    operator==(const Cofree<S, A, E>& a, const Cofree<S, A, E>& b) {
        return CofreeEqual<S, E>::equal(a, b, [](const A& x, const A& y) { return x == y; });
    }

    template <typename S, typename A, typename E>
    typename std::enable_if<is_equal<S>::value, bool>::type
    operator!=(const Cofree<S, A, E>& a, const Cofree<S, A, E>& b) {
        return !(a == b);
    }

    // Resolution. Rules are listed most specific first.

    template <typename S, typename E>
    struct Functor<cofree_shape<S, E>>
        : resolve<rule<is_functor<S>, CofreeComonad<S, E>>>::type {};

    template <typename S, typename E>
    struct Comonad<cofree_shape<S, E>>
        : resolve<rule<is_functor<S>, CofreeComonad<S, E>>>::type {};

    template <typename S, typename E>
    struct Foldable<cofree_shape<S, E>>
        : resolve<rule<is_foldable1<S>, CofreeFoldable1<S, E>>,
                  rule<is_foldable<S>, CofreeFoldable<S, E>>>::type {};

    template <typename S, typename E>
    struct Foldable1<cofree_shape<S, E>>
        : resolve<rule<is_foldable1<S>, CofreeFoldable1<S, E>>,
                  rule<is_foldable<S>, CofreeFoldable<S, E>>>::type {};

    template <typename S, typename E>
    struct Traverse<cofree_shape<S, E>>
        : resolve<rule<is_traverse1<S>, CofreeTraverse1<S, E>>,
                  rule<is_traverse<S>, CofreeTraverse<S, E>>>::type {};

    template <typename S, typename E>
    struct Traverse1<cofree_shape<S, E>>
        : resolve<rule<is_traverse1<S>, CofreeTraverse1<S, E>>,
                  rule<is_traverse<S>, CofreeTraverse<S, E>>>::type {};

    template <typename S, typename E>
    struct Bind<cofree_shape<S, E>>
        : resolve<rule<std::conjunction<is_plus_empty<S>, is_functor<S>>, CofreeMonad<S, E>>,
                  rule<std::conjunction<is_plus<S>, is_functor<S>>, CofreeBind<S, E>>>::type {};

    // The untagged Apply is the one bind gives; zipping goes through
    // cofree_zip_shape.
    template <typename S, typename E>
    struct Apply<cofree_shape<S, E>>
        : resolve<rule<std::conjunction<is_plus_empty<S>, is_functor<S>>, CofreeMonad<S, E>>,
                  rule<std::conjunction<is_plus<S>, is_functor<S>>, CofreeBind<S, E>>>::type {};

    template <typename S, typename E>
    struct Monad<cofree_shape<S, E>>
        : resolve<rule<std::conjunction<is_plus_empty<S>, is_functor<S>>, CofreeMonad<S, E>>>::type {};

    template <typename S, typename E>
    struct Applicative<cofree_shape<S, E>>
        : resolve<rule<std::conjunction<is_plus_empty<S>, is_functor<S>>, CofreeMonad<S, E>>>::type {};

    template <typename S, typename E>
    struct Equal<cofree_shape<S, E>>
        : resolve<rule<is_equal<S>, CofreeEqual<S, E>>>::type {};

    template <typename S, typename E>
    struct Functor<cofree_zip_shape<S, E>>
        : resolve<rule<std::conjunction<is_applicative<S>, is_lazy<E>>, CofreeZipApplicative<S, E>>,
                  rule<is_apply<S>, CofreeZipApply<S, E>>,
                  rule<is_functor<S>, CofreeZipFunctor<S, E>>>::type {};

    template <typename S, typename E>
    struct Apply<cofree_zip_shape<S, E>>
        : resolve<rule<std::conjunction<is_applicative<S>, is_lazy<E>>, CofreeZipApplicative<S, E>>,
                  rule<is_apply<S>, CofreeZipApply<S, E>>>::type {};

    template <typename S, typename E>
    struct Applicative<cofree_zip_shape<S, E>>
        : resolve<rule<std::conjunction<is_applicative<S>, is_lazy<E>>, CofreeZipApplicative<S, E>>>::type {};

    template <typename S, typename E>
    struct Equal<cofree_zip_shape<S, E>>
        : resolve<rule<is_equal<S>, CofreeZipEqual<S, E>>>::type {};

} // namespace coalg

#endif
