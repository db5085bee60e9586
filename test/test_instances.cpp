#include <coalg/coalg.hpp>
#include <gtest/gtest.h>

#include <boost/function.hpp>
#include <boost/optional.hpp>

#include <string>
#include <type_traits>
#include <vector>

using namespace coalg;

namespace {

typedef Cofree<vector_shape, int> Tree;
typedef Cofree<identity_shape, int, lazy> Stream;
typedef Cofree<pair_shape, int, lazy> Heap;

// Only rebinds; has no capabilities.
struct bare_shape {
    template <typename A>
    struct rebind {
        typedef std::vector<A> other;
    };
};

struct Stop {};

Tree leaf(int x) {
    return Tree(x, {});
}

Tree node(int x, std::vector<Tree> children) {
    return Tree(x, children);
}

Tree sample() {
    return node(1, {node(2, {leaf(4), leaf(5)}), leaf(3)});
}

// Heap-labelled complete binary tree with four levels: 1 to 15.
Tree full() {
    return unfold_c<vector_shape>(1, [](int n) {
        return n < 8 ? std::vector<int>{2 * n, 2 * n + 1} : std::vector<int>();
    });
}

Heap heap() {
    return unfold_c<pair_shape, lazy>(1, [](int n) { return Pair<int>{2 * n, 2 * n + 1}; });
}

Stream naturals() {
    return unfold_c<identity_shape, lazy>(0, [](int n) { return Identity<int>{n + 1}; });
}

std::vector<int> heads(const Tree& t) {
    return Foldable<cofree_shape<vector_shape>>::to_vector(t);
}

boost::optional<int> positive(int x) {
    if (x > 0)
        return x;
    return boost::none;
}

int identity(int x) {
    return x;
}

int add(int x, int y) {
    return x + y;
}

} // namespace

// Foldable: the native Foldable1 derivation when the shape has one.
static_assert(std::is_base_of<CofreeFoldable<vector_shape, eager>, Foldable<cofree_shape<vector_shape>>>::value, "");
static_assert(!std::is_base_of<CofreeFoldable1<vector_shape, eager>, Foldable<cofree_shape<vector_shape>>>::value, "");
static_assert(std::is_base_of<CofreeFoldable1<pair_shape, lazy>, Foldable1<cofree_shape<pair_shape, lazy>>>::value, "");
static_assert(std::is_base_of<CofreeFoldable1<non_empty_shape, lazy>, Foldable<cofree_shape<non_empty_shape, lazy>>>::value, "");
static_assert(is_foldable1<cofree_shape<optional_shape>>::value, "every cofree is non-empty");

// Traverse.
static_assert(std::is_base_of<CofreeTraverse<vector_shape, eager>, Traverse1<cofree_shape<vector_shape>>>::value, "");
static_assert(!std::is_base_of<CofreeTraverse1<vector_shape, eager>, Traverse1<cofree_shape<vector_shape>>>::value, "");
static_assert(std::is_base_of<CofreeTraverse1<pair_shape, lazy>, Traverse1<cofree_shape<pair_shape, lazy>>>::value, "");
static_assert(!is_traverse<cofree_shape<choice_shape>>::value, "");

// Bind and Monad.
static_assert(std::is_base_of<CofreeMonad<vector_shape, eager>, Monad<cofree_shape<vector_shape>>>::value, "");
static_assert(std::is_base_of<CofreeMonad<vector_shape, eager>, Apply<cofree_shape<vector_shape>>>::value, "");
static_assert(std::is_base_of<CofreeBind<non_empty_shape, lazy>, Bind<cofree_shape<non_empty_shape, lazy>>>::value, "");
static_assert(!std::is_base_of<CofreeMonad<non_empty_shape, lazy>, Bind<cofree_shape<non_empty_shape, lazy>>>::value, "");
static_assert(!is_monad<cofree_shape<non_empty_shape, lazy>>::value, "");
static_assert(!is_bind<cofree_shape<pair_shape, lazy>>::value, "");
static_assert(std::is_base_of<CofreeMonad<optional_shape, eager>, Applicative<cofree_shape<optional_shape>>>::value, "");

// Zipping only ever happens behind the tag.
static_assert(!std::is_base_of<CofreeZipApply<vector_shape, eager>, Apply<cofree_shape<vector_shape>>>::value, "");
static_assert(std::is_base_of<CofreeZipApply<vector_shape, eager>, Apply<cofree_zip_shape<vector_shape>>>::value, "");
static_assert(!is_applicative<cofree_zip_shape<vector_shape, eager>>::value, "");
static_assert(is_applicative<cofree_zip_shape<identity_shape, lazy>>::value, "");
static_assert(std::is_base_of<CofreeZipApplicative<pair_shape, lazy>, Functor<cofree_zip_shape<pair_shape, lazy>>>::value, "");
static_assert(std::is_base_of<CofreeZipFunctor<choice_shape, eager>, Functor<cofree_zip_shape<choice_shape>>>::value, "");
static_assert(!is_apply<cofree_zip_shape<choice_shape>>::value, "");
static_assert(is_equal<cofree_zip_shape<vector_shape>>::value, "");

// Nothing is derived from a shape without capabilities.
static_assert(!is_functor<cofree_shape<bare_shape>>::value, "");
static_assert(!is_comonad<cofree_shape<bare_shape>>::value, "");
static_assert(!is_foldable<cofree_shape<bare_shape>>::value, "");
static_assert(!is_equal<cofree_shape<bare_shape>>::value, "");
static_assert(!is_functor<cofree_zip_shape<bare_shape>>::value, "");

TEST(CofreeFoldable, AllFoldsAgree) {
    typedef Foldable1<cofree_shape<vector_shape>> F;
    Tree t = full();
    EXPECT_EQ(F::length(t), 15u);
    EXPECT_EQ(F::fold_map(t, identity), 120);
    EXPECT_EQ(F::fold_map1(t, identity), 120);
    EXPECT_EQ(F::fold_left(t, 0, add), 120);
    EXPECT_EQ(F::fold_right(t, 0, add), 120);
    EXPECT_EQ(F::fold_map_left1(t, identity, add), 120);
    EXPECT_EQ(F::fold_map_right1(t, identity, add), 120);
    EXPECT_EQ(F::fold_left1(t, add), 120);
    EXPECT_EQ(F::fold_right1(t, add), 120);
    EXPECT_EQ(F::fold_map1(t, [](int x) { return Max<int>{x}; }).value, 15);
    EXPECT_EQ(F::fold_map1(t, [](int x) { return Min<int>{x}; }).value, 1);
}

TEST(CofreeFoldable, FoldsVisitInPreorder) {
    typedef Foldable1<cofree_shape<vector_shape>> F;
    Tree t = full();
    std::vector<int> preorder{1, 2, 4, 8, 9, 5, 10, 11, 3, 6, 12, 13, 7, 14, 15};
    EXPECT_EQ(F::to_vector(t), preorder);

    std::vector<int> right = F::fold_right(t, std::vector<int>(), [](int a, std::vector<int> acc) {
        acc.insert(acc.begin(), a);
        return acc;
    });
    EXPECT_EQ(right, preorder);

    auto single = [](int a) { return std::vector<int>(1, a); };
    std::vector<int> left1 = F::fold_map_left1(t, single, [](std::vector<int> acc, int a) {
        acc.push_back(a);
        return acc;
    });
    std::vector<int> right1 = F::fold_map_right1(t, single, [](int a, std::vector<int> acc) {
        acc.insert(acc.begin(), a);
        return acc;
    });
    EXPECT_EQ(left1, preorder);
    EXPECT_EQ(right1, preorder);

    EXPECT_EQ(F::fold_left1(t, [](int a, int b) { return a - b; }), 1 - 119);
    EXPECT_EQ(F::fold_map1(t, [](int x) { return Last<int>{x}; }).value, 15);
    EXPECT_EQ(F::fold_map1(t, [](int x) { return First<int>{x}; }).value, 1);
}

TEST(CofreeFoldable, NativeAndGenericFoldMap1VisitAlike) {
    std::vector<int> native;
    std::vector<int> generic;
    auto recorder = [](std::vector<int>& seen) {
        return [&seen](int x) {
            seen.push_back(x);
            if (x >= 8)
                throw Stop();
            return x;
        };
    };
    typedef Foldable1<cofree_shape<pair_shape, lazy>> Native;
    typedef CofreeFoldable<pair_shape, lazy> Generic;
    EXPECT_THROW(Native::fold_map1(heap(), recorder(native)), Stop);
    EXPECT_THROW(Generic::fold_map1(heap(), recorder(generic)), Stop);
    EXPECT_EQ(native, (std::vector<int>{1, 2, 4, 8}));
    EXPECT_EQ(generic, native);
}

TEST(CofreeFoldable, FiniteOptionalBranching) {
    Cofree<optional_shape, int> path = sample().map_branching<optional_shape>(vector_to_optional());
    EXPECT_EQ(Foldable1<cofree_shape<optional_shape>>::fold_map1(path, identity), 7);
    EXPECT_EQ(Foldable<cofree_shape<optional_shape>>::fold_right1(path, [](int a, int b) { return a - b; }), 1 - (2 - 4));
}

TEST(CofreeTraverse, OptionalEffect) {
    typedef Traverse<cofree_shape<vector_shape>> T;
    boost::optional<Tree> all = T::traverse<optional_shape>(sample(), positive);
    ASSERT_TRUE(all);
    EXPECT_EQ(*all, sample());
    EXPECT_FALSE(T::traverse<optional_shape>(node(1, {leaf(2), leaf(0)}), positive));
}

TEST(CofreeTraverse, VectorEffectEnumeratesChoices) {
    std::vector<Tree> trees = Traverse<cofree_shape<vector_shape>>::traverse<vector_shape>(
        node(1, {leaf(2)}), [](int x) { return std::vector<int>{x, -x}; });
    ASSERT_EQ(trees.size(), 4u);
    EXPECT_EQ(heads(trees[0]), (std::vector<int>{1, 2}));
    EXPECT_EQ(heads(trees[1]), (std::vector<int>{1, -2}));
    EXPECT_EQ(heads(trees[2]), (std::vector<int>{-1, 2}));
    EXPECT_EQ(heads(trees[3]), (std::vector<int>{-1, -2}));
}

TEST(CofreeTraverse, GenericTraverse1MatchesTraverse) {
    typedef Traverse<cofree_shape<vector_shape>> T;
    Tree t = full();
    boost::optional<Tree> via_point = T::traverse<optional_shape>(t, positive);
    boost::optional<Tree> via_apply = T::traverse1<optional_shape>(t, positive);
    ASSERT_TRUE(via_point);
    ASSERT_TRUE(via_apply);
    EXPECT_EQ(*via_point, *via_apply);
    EXPECT_FALSE(T::traverse1<optional_shape>(node(1, {leaf(-1)}), positive));

    boost::optional<Tree> lone = T::traverse1<optional_shape>(leaf(3), positive);
    ASSERT_TRUE(lone);
    EXPECT_EQ(*lone, leaf(3));
}

TEST(CofreeTraverse, NativeAndGenericTraverse1VisitAlike) {
    std::vector<int> native;
    std::vector<int> generic;
    auto recorder = [](std::vector<int>& seen) {
        return [&seen](int x) -> boost::optional<int> {
            seen.push_back(x);
            if (x >= 8)
                throw Stop();
            return x;
        };
    };
    typedef Traverse1<cofree_shape<pair_shape, lazy>> Native;
    typedef CofreeTraverse<pair_shape, lazy> Generic;
    EXPECT_THROW(Native::traverse1<optional_shape>(heap(), recorder(native)), Stop);
    EXPECT_THROW(Generic::traverse1<optional_shape>(heap(), recorder(generic)), Stop);
    EXPECT_EQ(native, (std::vector<int>{1, 2, 4, 8}));
    EXPECT_EQ(generic, native);
}

TEST(CofreeMonad, BindPutsNewBranchesFirst) {
    Tree a = node(1, {leaf(2)});
    auto f = [](int x) { return node(x, {leaf(10 * x)}); };
    EXPECT_EQ(Bind<cofree_shape<vector_shape>>::bind(a, f), node(1, {leaf(10), node(2, {leaf(20)})}));
}

TEST(CofreeMonad, Laws) {
    typedef Monad<cofree_shape<vector_shape>> M;
    auto point = [](int x) { return M::point(x); };
    auto f = [](int x) { return node(x, {leaf(10 * x)}); };
    auto g = [](int x) { return node(-x, {leaf(x + 100), leaf(x + 200)}); };
    Tree m = sample();

    EXPECT_EQ(M::point(3), leaf(3));
    EXPECT_EQ(M::bind(M::point(3), f), f(3));
    EXPECT_EQ(M::bind(m, point), m);
    EXPECT_EQ(M::bind(M::bind(m, f), g), M::bind(m, [f, g](int x) { return M::bind(f(x), g); }));
}

TEST(CofreeMonad, ApRunsEveryFunction) {
    typedef boost::function<int(int)> Fn;
    Tree a = node(1, {leaf(2)});
    Cofree<vector_shape, Fn> fs(Fn([](int x) { return x + 1; }), {});
    EXPECT_EQ(Apply<cofree_shape<vector_shape>>::ap(a, fs), node(2, {leaf(3)}));
}

TEST(CofreeMonad, OptionalBranchingKeepsFirstPath) {
    typedef Cofree<optional_shape, int> Path;
    typedef Monad<cofree_shape<optional_shape>> M;
    Path p(1, boost::optional<Path>(Path(2, boost::none)));
    Path r = M::bind(p, [](int x) { return Path(x * 10, boost::optional<Path>(Path(x * 100, boost::none))); });
    EXPECT_EQ(Foldable<cofree_shape<optional_shape>>::to_vector(r), (std::vector<int>{10, 100}));
}

TEST(CofreeBind, NonEmptyBranchingWithoutPoint) {
    typedef Cofree<non_empty_shape, int, lazy> Rose;
    Rose a = unfold_c<non_empty_shape, lazy>(1, [](int n) { return non_empty(n + 1); });
    Rose r = Bind<cofree_shape<non_empty_shape, lazy>>::bind(a, [](int x) {
        return unfold_c<non_empty_shape, lazy>(x * 10, [](int n) { return non_empty(n + 1); });
    });
    EXPECT_EQ(r.head(), 10);
    ASSERT_EQ(r.tail().size(), 2u);
    EXPECT_EQ(r.tail().head.head(), 11);
    EXPECT_EQ(r.tail().tail[0].head(), 20);
}

TEST(CofreeZip, DiffersFromTheMonad) {
    Tree a = node(1, {leaf(2)});
    Tree b = node(10, {leaf(20)});
    Tree monadic = Apply<cofree_shape<vector_shape>>::apply2(a, b, add);
    Tree zipped = Apply<cofree_zip_shape<vector_shape>>::apply2(zip(a), zip(b), add).untag();
    EXPECT_EQ(monadic, node(11, {leaf(21), node(12, {leaf(22)})}));
    EXPECT_EQ(zipped, node(11, {leaf(22)}));
    EXPECT_NE(monadic, zipped);
}

TEST(CofreeZip, PairsHeadsPointwise) {
    typedef Apply<cofree_zip_shape<pair_shape, lazy>> Z;
    Heap sums = Z::apply2(zip(heap()), zip(heap()), add).untag();
    EXPECT_EQ(sums.head(), 2);
    EXPECT_EQ(sums.tail().second.tail().first.head(), 12);
}

TEST(CofreeZip, ApAndMap) {
    typedef boost::function<int(int)> Fn;
    Tree a = node(1, {leaf(2), leaf(3)});
    Cofree<vector_shape, Fn> fs(Fn([](int x) { return x * 2; }), {Cofree<vector_shape, Fn>(Fn([](int x) { return x * 3; }), {})});
    Tree r = Apply<cofree_zip_shape<vector_shape>>::ap(zip(a), zip(fs)).untag();
    EXPECT_EQ(r, node(2, {leaf(6), leaf(9)}));

    Tree m = Functor<cofree_zip_shape<vector_shape>>::map(zip(a), [](int x) { return x + 1; }).untag();
    EXPECT_EQ(m, a.map([](int x) { return x + 1; }));
}

TEST(CofreeZip, PointRepeatsForever) {
    typedef Applicative<cofree_zip_shape<identity_shape, lazy>> Z;
    Stream tens = Z::point(10).untag();
    EXPECT_EQ(tens.tail().value.tail().value.tail().value.head(), 10);

    Stream shifted = Z::apply2(zip(naturals()), Z::point(10), add).untag();
    EXPECT_EQ(shifted.head(), 10);
    EXPECT_EQ(shifted.tail().value.tail().value.head(), 12);
}

TEST(CofreeZip, BuiltDirectly) {
    CofreeZip<vector_shape, int> z = cofree_zip<vector_shape>(1, std::vector<Tree>{leaf(2)});
    static_assert(std::is_same<CofreeZip<vector_shape, int>, Tagged<Tree, zip_tag>>::value, "");
    EXPECT_EQ(z.untag(), node(1, {leaf(2)}));
    EXPECT_TRUE(z == zip(node(1, {leaf(2)})));
    EXPECT_TRUE(Equal<cofree_zip_shape<vector_shape>>::equal(z, z, [](int x, int y) { return x == y; }));
}

TEST(CofreeComonad, TraitMatchesMembers) {
    typedef Comonad<cofree_shape<vector_shape>> W;
    Tree t = sample();
    EXPECT_EQ(W::copoint(t), 1);
    EXPECT_EQ(W::cojoin(t).head(), t);
    EXPECT_EQ(W::cobind(t, [](const Tree& c) { return static_cast<int>(c.tail().size()); }),
              node(2, {node(2, {leaf(0), leaf(0)}), leaf(0)}));
    EXPECT_EQ(W::map(t, [](int x) { return x * x; }), t.map([](int x) { return x * x; }));
}
