#ifndef COALG_COFREE_HPP
#define COALG_COFREE_HPP

#include <coalg/capability.hpp>
#include <coalg/config.hpp>
#include <coalg/evaluation.hpp>
#include <coalg/tag.hpp>

#include <boost/shared_ptr.hpp>

#include <type_traits>
#include <utility>
#include <vector>

namespace coalg {

    template <typename G, typename A>
    class Free;

    // The cofree comonad of a shape S: a value at every node and an
    // S-shaped branching of further nodes. E decides whether a node's
    // branching is built with the node (eager) or on first access (lazy).
    template <typename S, typename A, typename E = COALG_DEFAULT_EVALUATION>
    class Cofree {
    public:
        typedef S shape_type;
        typedef A value_type;
        typedef E evaluation_type;
        typedef apply_t<S, Cofree> tail_type;

        Cofree(A head, tail_type tail)
            : head_(std::move(head)), tail_(suspended<tail_type>::ready(std::move(tail))) {}

        Cofree(const Cofree&) = default;
        Cofree(Cofree&&) = default;

        Cofree& operator=(Cofree other) {
            head_ = std::move(other.head_);
            tail_.swap(other.tail_);
            return *this;
        }

        ~Cofree() {
            release(is_foldable<S>());
        }

        // The branching is produced by make_tail, now or on demand as E says.
        template <typename F>
        static Cofree suspend(A head, F make_tail) {
            return Cofree(from_cell(), std::move(head), defer<E, tail_type>(make_tail));
        }

        const A& head() const {
            return head_;
        }

        const A& extract() const {
            return head_;
        }

        const A& copure() const {
            return head_;
        }

        const tail_type& tail() const {
            return tail_->force();
        }

        const tail_type& out() const {
            return tail();
        }

        bool tail_evaluated() const {
            return tail_->evaluated();
        }

        std::pair<A, tail_type> to_pair() const {
            return std::make_pair(head_, tail());
        }

        template <typename F>
        Cofree<S, result_t<F, const A&>, E> map(F f) const {
            return apply_cofree(f, [f](const Cofree& c) { return c.map(f); });
        }

        // Redecorates every node with f applied to the subtree rooted there.
        template <typename F>
        Cofree<S, result_t<F, const Cofree&>, E> extend(F f) const {
            return apply_tail(f(*this), [f](const Cofree& c) { return c.extend(f); });
        }

        Cofree<S, Cofree, E> duplicate() const {
            return apply_tail(*this, [](const Cofree& c) { return c.duplicate(); });
        }

        // Bottom-up fold that keeps every intermediate result. g sees the
        // head and the already rebuilt children.
        template <typename B, typename G>
        Cofree<S, B, E> scanr(G g) const {
            static_assert(is_functor<S>::value, "Cofree::scanr needs a Functor for the branching shape");
            typedef Cofree<S, B, E> result_type;
            typename result_type::tail_type qs = Functor<S>::map(tail(), [g](const Cofree& c) {
                return c.template scanr<B>(g);
            });
            B h = g(head_, qs);
            return result_type(h, qs);
        }

        // Changes the branching shape at every level with the natural
        // transformation nt : S ~> T.
        template <typename T, typename N>
        Cofree<T, A, E> map_branching(N nt) const {
            static_assert(is_functor<S>::value, "Cofree::map_branching needs a Functor for the branching shape");
            Cofree self = *this;
            return Cofree<T, A, E>::suspend(head_, [self, nt]() {
                return nt(Functor<S>::map(self.tail(), [nt](const Cofree& c) {
                    return c.template map_branching<T>(nt);
                }));
            });
        }

        // Changes only the root's branching with nt : S ~> S.
        template <typename N>
        Cofree map_first_branching(N nt) const {
            Cofree self = *this;
            return suspend(head_, [self, nt]() { return nt(self.tail()); });
        }

        // Replaces every head, the root's included, with b.
        template <typename B>
        Cofree<S, B, E> inject(B b) const {
            return apply_tail(b, [b](const Cofree& c) { return c.inject(b); });
        }

        template <typename F, typename G>
        Cofree<S, result_t<F, const A&>, E> apply_cofree(F f, G g) const {
            static_assert(is_functor<S>::value, "Cofree needs a Functor for the branching shape");
            typedef Cofree<S, result_t<F, const A&>, E> result_type;
            Cofree self = *this;
            return result_type::suspend(f(head_), [self, g]() { return Functor<S>::map(self.tail(), g); });
        }

        template <typename B, typename G>
        Cofree<S, B, E> apply_tail(B b, G g) const {
            return apply_cofree([b](const A&) { return b; }, g);
        }

        // Walks this structure along the suspensions of bs, both sides
        // annihilating through Zap<S, G>, and combines the head reached with
        // the value bs ends in. Defined in zap.hpp, which callers of zap_with
        // and zap must include.
        template <typename G, typename B, typename F>
        result_t<F, const A&, const B&> zap_with(const Free<G, B>& bs, F f) const;

        template <typename G, typename Fn>
        result_t<Fn, const A&> zap(const Free<G, Fn>& fs) const;

    private:
        struct from_cell {};

        // Spelled as shared_ptr so that suspended<tail_type> is not
        // instantiated while Cofree is still incomplete.
        typedef boost::shared_ptr<const suspended<tail_type>> cell_pointer;

        Cofree(from_cell, A head, cell_pointer tail)
            : head_(std::move(head)), tail_(std::move(tail)) {}

        void release(std::false_type) {}

        // Drops cells from a worklist so that a long chain of evaluated
        // tails is freed without recursing once per level. A cell still
        // shared elsewhere, or not yet evaluated, is released as is.
        void release(std::true_type) {
            if (!tail_)
                return;
            std::vector<cell_pointer> pending;
            pending.push_back(std::move(tail_));
            while (!pending.empty()) {
                cell_pointer cell = std::move(pending.back());
                pending.pop_back();
                if (cell.use_count() == 1 && cell->evaluated())
                    Foldable<S>::fold_left(cell->force(), &pending, [](std::vector<cell_pointer>* acc, const Cofree& c) {
                        if (c.tail_)
                            acc->push_back(c.tail_);
                        return acc;
                    });
            }
        }

        A head_;
        cell_pointer tail_;
    };

    // Shape of Cofree<S, _, E>, for looking up its capabilities.
    template <typename S, typename E = COALG_DEFAULT_EVALUATION>
    struct cofree_shape {
        template <typename A>
        struct rebind {
            typedef Cofree<S, A, E> other;
        };
    };

    // Same values, but Apply and Applicative zip instead of bind.
    // Cofree whose Apply and Applicative zip.
    template <typename S, typename A, typename E = COALG_DEFAULT_EVALUATION>
    using CofreeZip = Tagged<Cofree<S, A, E>, zip_tag>;

    template <typename S, typename E = COALG_DEFAULT_EVALUATION>
    struct cofree_zip_shape {
        template <typename A>
        struct rebind {
            typedef CofreeZip<S, A, E> other;
        };
    };

    template <typename S, typename E = COALG_DEFAULT_EVALUATION, typename A>
    CofreeZip<S, A, E> cofree_zip(A head, typename Cofree<S, A, E>::tail_type tail) {
        return tag<zip_tag>(Cofree<S, A, E>(std::move(head), std::move(tail)));
    }

    template <typename S, typename A, typename E>
    CofreeZip<S, A, E> zip(const Cofree<S, A, E>& c) {
        return tag<zip_tag>(c);
    }

    // Cofree corecursion: f gives the seeds of a seed's children.
    template <typename S, typename E = COALG_DEFAULT_EVALUATION, typename A, typename F>
    Cofree<S, A, E> unfold_c(A a, F f) {
        static_assert(is_functor<S>::value, "unfold_c needs a Functor for the branching shape");
        return Cofree<S, A, E>::suspend(a, [a, f]() {
            return Functor<S>::map(f(a), [f](const A& x) { return unfold_c<S, E>(x, f); });
        });
    }

    // Like unfold_c, but f splits a seed into the head and the child seeds.
    template <typename S, typename E = COALG_DEFAULT_EVALUATION, typename B, typename F>
    Cofree<S, typename result_t<F, const B&>::first_type, E> unfold(B b, F f) {
        static_assert(is_functor<S>::value, "unfold needs a Functor for the branching shape");
        typedef typename result_t<F, const B&>::first_type A;
        typedef typename result_t<F, const B&>::second_type seeds_type;
        result_t<F, const B&> step = f(b);
        seeds_type seeds = step.second;
        return Cofree<S, A, E>::suspend(step.first, [seeds, f]() {
            return Functor<S>::map(seeds, [f](const B& x) { return unfold<S, E>(x, f); });
        });
    }

} // namespace coalg

#endif
