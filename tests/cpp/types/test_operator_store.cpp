#include <opgraph/types/builtin_operators.h>
#include <opgraph/types/operator_store.h>
#include <opgraph/util/errors.h>

#include <catch2/catch_test_macros.hpp>

namespace opgraph::test {

namespace {

struct Fixture {
    OperatorTypeRegistry registry{OperatorTypeRegistry::with_builtin_types()};
    OperatorStore store;

    operator_s_ptr make(std::string path, std::string_view type = "NumberOp") {
        return registry.make_operator(registry.find(type), std::move(path));
    }

    operator_s_ptr add(std::string path, std::string_view type = "NumberOp") {
        auto op = make(std::move(path), type);
        store.set(op->path(), op);
        return op;
    }
};

} // namespace

TEST_CASE("OperatorStore basic operations", "[store]") {
    Fixture f;
    REQUIRE(f.store.empty());

    auto op = f.add("/num");
    REQUIRE(f.store.has("/num"));
    REQUIRE(f.store.get("/num") == op);
    REQUIRE(f.store.get("/missing") == nullptr);
    REQUIRE(f.store.size() == 1);
    REQUIRE(f.store.paths() == std::vector<std::string>{"/num"});

    REQUIRE(f.store.erase("/num") == op);
    REQUIRE(f.store.erase("/num") == nullptr);
    REQUIRE_FALSE(f.store.has("/num"));

    f.add("/a");
    f.add("/b");
    f.store.clear();
    REQUIRE(f.store.empty());
}

TEST_CASE("OperatorStore set replaces the occupant", "[store]") {
    Fixture f;
    auto first = f.add("/num");
    auto second = f.make("/num", "MathOp");
    f.store.set("/num", second);

    REQUIRE(f.store.size() == 1);
    REQUIRE(f.store.get("/num") == second);
    REQUIRE(f.store.get("/num") != first);
}

TEST_CASE("OperatorStore set rejects malformed identities", "[store]") {
    Fixture f;
    auto op = f.make("/num");
    REQUIRE_THROWS_AS(f.store.set("num", op), IdentityError);
    REQUIRE_THROWS_AS(f.store.set("/num/", op), IdentityError);
    REQUIRE_THROWS_AS(f.store.set("/other", op), IdentityError);
    REQUIRE_THROWS_AS(f.store.set("/num", nullptr), IdentityError);
    REQUIRE(f.store.empty());
}

TEST_CASE("OperatorStore iterates in insertion order", "[store]") {
    Fixture f;
    f.add("/c");
    f.add("/a");
    f.add("/b");

    std::vector<std::string> paths;
    for (const auto &[path, op] : f.store) {
        REQUIRE(op->path() == path);
        paths.push_back(path);
    }
    REQUIRE(paths == std::vector<std::string>{"/c", "/a", "/b"});
}

TEST_CASE("get_op resolves references", "[store]") {
    Fixture f;
    auto top = f.add("/code");
    auto sibling = f.add("/analysis/transform");
    auto nested = f.add("/analysis/preprocessing/filter");

    REQUIRE(f.store.get_op("/code") == top);
    REQUIRE(f.store.get_op("/analysis/./transform") == sibling);
    REQUIRE(f.store.get_op("code") == nullptr);
    REQUIRE(f.store.get_op("code", "/other") == top);
    REQUIRE(f.store.get_op("../transform", "/analysis/preprocessing/filter") == sibling);
    REQUIRE(f.store.get_op("./filter", "/analysis/preprocessing/other") == nested);
    REQUIRE(f.store.get_op("filter", "/analysis/preprocessing/other") == nested);
    REQUIRE(f.store.get_op("/code", "/analysis/preprocessing/filter") == top);

    REQUIRE(f.store.get_op("missing", "/analysis/transform") == nullptr);
    REQUIRE(f.store.get_op("", "/analysis/transform") == nullptr);
    REQUIRE(f.store.get_op("filter", "") == nullptr);
}

TEST_CASE("Derived scans over the store", "[store]") {
    Fixture f;
    f.add("/source");
    f.add("/group", "ContainerOp");
    auto child = f.add("/group/child", "MathOp");
    auto grandchild = f.add("/group/inner/leaf", "MathOp");
    child->input("a")->subscribe(Subscription{"/source", "val"});
    grandchild->input("b")->subscribe(Subscription{"/source", "val"});

    auto dependents = f.store.dependents_of("/source");
    REQUIRE(dependents == std::vector<operator_s_ptr>{child, grandchild});
    REQUIRE(f.store.dependents_of("/group/child").empty());

    REQUIRE(f.store.direct_children("/group") == std::vector<operator_s_ptr>{child});
    REQUIRE(f.store.descendants_of("/group") == std::vector<operator_s_ptr>{child, grandchild});
    REQUIRE(f.store.direct_children("/").empty());
    REQUIRE(f.store.descendants_of("/").size() == 4);
}

TEST_CASE("unique_path appends a numeric suffix when taken", "[store]") {
    Fixture f;
    REQUIRE(f.store.unique_path("num", "/") == "/num");

    f.add("/num");
    f.add("/num-1");
    REQUIRE(f.store.unique_path("num", "/") == "/num-2");
    REQUIRE(f.store.unique_path("num", "group") == "/group/num");
}

TEST_CASE("drop_dangling_subscriptions removes references to missing sources", "[store]") {
    Fixture f;
    f.add("/source");
    auto math = f.add("/math", "MathOp");
    math->input("a")->subscribe(Subscription{"/source", "val"});
    math->input("b")->subscribe(Subscription{"/source", "no_such_field"});

    std::vector<std::string> dropped;
    REQUIRE(f.store.drop_dangling_subscriptions([&](const Operator &, std::string_view field, const Subscription &) {
        dropped.emplace_back(field);
    }) == 1);
    REQUIRE(dropped == std::vector<std::string>{"b"});

    f.store.erase("/source");
    REQUIRE(f.store.drop_dangling_subscriptions() == 1);
    REQUIRE_FALSE(math->input("a")->is_connected());
}

} // namespace opgraph::test
