#include "testing.hpp"

#include <cmath>
#include <functional>
#include <limits>
#include <stdexcept>

using namespace arbor::vdom;

TEST_CASE("descriptions that render nothing", "[vdom][normalize]") {
  REQUIRE_FALSE(normalize(Source{}));
  REQUIRE_FALSE(normalize(Source{""}));
  REQUIRE_FALSE(normalize(seq({})));
  REQUIRE_FALSE(normalize(Source{Source::Mapping{}}));
  REQUIRE_FALSE(normalize(attrs({{"div", nullptr}, {"span", nullptr}})));
  REQUIRE_FALSE(normalize(Source{handler([](Event &) {})}));
  REQUIRE_FALSE(normalize(seq({nullptr, "", seq({})})));
}

TEST_CASE("primitives become text nodes", "[vdom][normalize]") {
  REQUIRE(*normalize(Source{"hi"}) == text("hi"));
  REQUIRE(*normalize(Source{42}) == text("42"));
  REQUIRE(*normalize(Source{-7}) == text("-7"));
  REQUIRE(*normalize(Source{3.0}) == text("3"));
  REQUIRE(*normalize(Source{2.5}) == text("2.5"));
  REQUIRE(*normalize(Source{true}) == text("true"));
  REQUIRE(*normalize(Source{false}) == text("false"));
}

TEST_CASE("number formatting", "[vdom][normalize]") {
  REQUIRE(format_number(0.0) == "0");
  REQUIRE(format_number(-12.0) == "-12");
  REQUIRE(format_number(0.125) == "0.125");
  REQUIRE(format_number(std::nan("")) == "NaN");
  REQUIRE(format_number(std::numeric_limits<double>::infinity()) == "Infinity");
  REQUIRE(format_number(-std::numeric_limits<double>::infinity()) == "-Infinity");
}

TEST_CASE("single-entry mappings become elements", "[vdom][normalize]") {
  SECTION("primitive value is the only text child") {
    REQUIRE(
      *normalize(leaf("span", "hi")) ==
      element("span", {}, {text("hi")}));
    REQUIRE(*normalize(leaf("b", 5)) == element("b", {}, {text("5")}));
  }

  SECTION("null value gives an empty element") {
    REQUIRE(*normalize(leaf("br", nullptr)) == element("br"));
  }

  SECTION("attributes, key and children") {
    auto n = normalize(el(
      "div",
      {{"className", "a"},
      {"key", "k1"},
      {"tabIndex", 2},
      {"hidden", false},
      {"children", seq({"x", nullptr, seq({"y", "z"})})}}));
    REQUIRE(n);
    REQUIRE(
      *n ==
      element(
        "div",
        {{"className", PropValue{std::string{"a"}}},
        {"tabIndex", PropValue{std::int64_t{2}}},
        {"hidden", PropValue{false}}},
        {text("x"), text("y"), text("z")},
        NodeKey{std::string{"k1"}}));
    REQUIRE_FALSE(n->props.contains("key"));
    REQUIRE_FALSE(n->props.contains("children"));
  }

  SECTION("text short-circuits children") {
    REQUIRE(
      *normalize(el("p", {{"text", "hello"}, {"children", seq({"no"})}})) ==
      element("p", {}, {text("hello")}));
  }

  SECTION("null text falls back to children") {
    REQUIRE(
      *normalize(el("p", {{"text", nullptr}, {"children", "yes"}})) ==
      element("p", {}, {text("yes")}));
  }

  SECTION("empty text gives no child") {
    REQUIRE(*normalize(el("p", {{"text", ""}})) == element("p"));
  }

  SECTION("null and nested attribute values are skipped") {
    auto n = normalize(el(
      "a",
      {{"href", nullptr},
      {"title", "t"},
      {"data", seq({"x"})},
      {"meta", attrs({{"k", "v"}})}}));
    REQUIRE(n);
    REQUIRE(n->props.size() == 1);
    REQUIRE(prop_as_string(n->props, "title", "") == "t");
  }

  SECTION("handlers are kept by identity") {
    const auto h = handler([](Event &) {});
    auto n = normalize(el("button", {{"onClick", h}}));
    REQUIRE(n);
    const auto *pv = find_prop(n->props, "onClick");
    REQUIRE(pv);
    REQUIRE(std::get<Handler>(*pv) == h);
    REQUIRE_FALSE(std::get<Handler>(*pv) == handler([](Event &) {}));
  }

  SECTION("integer and integral keys") {
    REQUIRE(normalize(el("li", {{"key", 7}}))->key == NodeKey{std::int64_t{7}});
    REQUIRE(normalize(el("li", {{"key", 3.0}}))->key == NodeKey{std::int64_t{3}});
    REQUIRE(
      normalize(el("li", {{"key", 1.5}}))->key ==
      NodeKey{std::string{"1.5"}});
  }

  SECTION("boolean keys become string keys") {
    REQUIRE(normalize(el("li", {{"key", true}}))->key == NodeKey{std::string{"true"}});
    REQUIRE(normalize(el("li", {{"key", false}}))->key == NodeKey{std::string{"false"}});
    REQUIRE_FALSE(normalize(el("li", {{"key", seq({"a"})}}))->key);
  }
}

TEST_CASE("sequences flatten into forests", "[vdom][normalize]") {
  auto n = normalize(seq({"a", seq({"b", seq({})}), nullptr, leaf("i", "c")}));
  REQUIRE(n);
  REQUIRE(
    *n == forest({text("a"), text("b"), element("i", {}, {text("c")})}));

  auto inner = normalize(el(
    "ul", {{"children", seq({seq({leaf("li", 1), leaf("li", 2)}), ""})}}));
  REQUIRE(inner);
  REQUIRE(inner->children.size() == 2);
  REQUIRE(inner->children[1] == element("li", {}, {text("2")}));
}

TEST_CASE("producers are invoked", "[vdom][normalize]") {
  int calls = 0;
  auto n = normalize(lazy([&] {
    ++calls;
    return leaf("b", "x");
  }));
  REQUIRE(calls == 1);
  REQUIRE(*n == element("b", {}, {text("x")}));
}

TEST_CASE("producer failures become error placeholders", "[vdom][normalize]") {
  auto failing = lazy([]() -> Source { throw std::runtime_error("boom"); });

  REQUIRE(
    *normalize(failing) ==
    element(
      "span",
      {{"className", PropValue{std::string{"_error"}}}},
      {text("Error: boom")}));

  auto n = normalize(seq({failing, "after"}));
  REQUIRE(n);
  REQUIRE(n->children.size() == 2);
  REQUIRE(n->children[0] == producer_error_placeholder("boom"));
  REQUIRE(n->children[1] == text("after"));
}

TEST_CASE("depth guard", "[vdom][normalize]") {
  ReconcileOptions options;
  options.max_depth = 2;

  auto deep = el(
    "a",
    {{"children",
     el("b",
      {{"children",
       el("c", {{"children", el("d", {{"text", "x"}})}})}})}});

  REQUIRE(
    *normalize(deep, options) ==
    element(
      "a",
      {},
      {element(
        "b", {}, {element("c", {}, {depth_exceeded_placeholder()})})}));

  SECTION("self-referencing producers terminate") {
    std::function<Source()> loop;
    loop = [&] { return seq({lazy(loop)}); };
    auto n = normalize(lazy(loop));
    REQUIRE(n);
    REQUIRE(*n == forest({depth_exceeded_placeholder()}));
  }
}

TEST_CASE("builder produces normalizable descriptions", "[vdom][normalize]") {
  auto src = node("ul")
         .attr("className", "list")
         .children_from([](auto &list) {
           for (int i = 0; i < 3; ++i) {
             list.add(node("li").key(i).text(i * 10).build());
           }
         })
         .build();

  auto n = normalize(src);
  REQUIRE(n);
  REQUIRE(n->type == "ul");
  REQUIRE(n->children.size() == 3);
  REQUIRE(n->children[2].key == NodeKey{std::int64_t{2}});
  REQUIRE(n->children[2].children == std::vector<CanonicalNode>{text("20")});
}
