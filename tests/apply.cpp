#include "testing.hpp"

#include <string>
#include <vector>

using namespace arbor::vdom;
using namespace arbor::vdom::testing;

namespace {

struct Fixture {
  Document doc;
  DomBackend backend{doc};
  PatchApplier applier{backend};

  NodeId root() const { return *doc.child_at(doc.mount(), 0); }
};

} // namespace

TEST_CASE("applying to an empty mount", "[vdom][apply]") {
  Fixture f;
  auto tree = element("p", {}, {text("hi")});
  REQUIRE(f.applier.apply(f.doc.mount(), {PatchCreate{{}, tree}}) == f.doc.mount());
  REQUIRE(f.applier.warnings().empty());
  REQUIRE(text_content(f.doc, f.root()) == "hi");

  f.applier.apply(f.doc.mount(), {PatchRemove{{}}});
  REQUIRE(f.applier.warnings().empty());
  REQUIRE(f.doc.child_count(f.doc.mount()) == 0);
}

TEST_CASE("failed patches do not stop the batch", "[vdom][apply]") {
  Fixture f;
  materialize(f.doc, element("div", {}, {text("a")}));

  f.applier.apply(
    f.doc.mount(),
    {PatchRemove{{5}},
    PatchUpdateProp{{}, "id", std::nullopt, PropValue{std::string{"x"}}},
    PatchMove{{0}, 0, 3},
    PatchCreate{{7}, text("late")},
    PatchCreate{{1}, text("b")}});

  const auto &w = f.applier.warnings();
  REQUIRE(w.size() == 3);
  REQUIRE(w[0].index == 0);
  REQUIRE(w[1].index == 2);
  REQUIRE(w[2].index == 3);
  REQUIRE(f.doc.attribute(f.root(), "id") == std::string{"x"});
  REQUIRE(text_content(f.doc, f.root()) == "ab");

  SECTION("warnings are reset per batch") {
    f.applier.apply(f.doc.mount(), {});
    REQUIRE(f.applier.warnings().empty());
  }
}

TEST_CASE("nothing rendered is reported, not thrown", "[vdom][apply]") {
  Fixture f;
  REQUIRE_NOTHROW(f.applier.apply(
    f.doc.mount(),
    {PatchUpdateProp{{}, "id", std::nullopt, PropValue{std::string{"x"}}}}));
  REQUIRE(f.applier.warnings().size() == 1);
}

TEST_CASE("invalid nodes fail only their own patch", "[vdom][apply]") {
  Fixture f;
  f.applier.apply(
    f.doc.mount(), {PatchCreate{{}, element("")}, PatchCreate{{}, element("ok")}});
  REQUIRE(f.applier.warnings().size() == 1);
  REQUIRE(f.doc.find(f.root())->tag == "ok");
}

TEST_CASE("move keeps focus and listeners", "[vdom][apply]") {
  Fixture f;
  int clicks = 0;
  const auto h = handler([&](Event &) { ++clicks; });
  materialize(
    f.doc,
    element(
      "ul",
      {},
      {keyed("li", "a", "A"),
      keyed("li", "b", "B"),
      element("li", {{"onClick", PropValue{h}}}, {text("C")}, NodeKey{std::string{"c"}})}));

  const auto c = *f.doc.child_at(f.root(), 2);
  f.doc.focus(c);

  f.applier.apply(f.doc.mount(), {PatchMove{{0}, 2, 0}});
  REQUIRE(f.applier.warnings().empty());
  REQUIRE(f.doc.child_at(f.root(), 0) == c);
  REQUIRE(f.doc.focused() == c);
  REQUIRE(f.doc.dispatch_event(c, "click"));
  REQUIRE(clicks == 1);
}

TEST_CASE("forest replacement swaps the child list", "[vdom][apply]") {
  Fixture f;
  materialize(f.doc, element("ul", {{"id", PropValue{std::string{"keep"}}}}, {text("1"), text("2"), text("3")}));
  const auto ul = f.root();

  f.applier.apply(f.doc.mount(), {PatchReplace{{}, forest({text("x")})}});
  REQUIRE(f.applier.warnings().empty());
  REQUIRE(f.root() == ul);
  REQUIRE(f.doc.attribute(ul, "id") == std::string{"keep"});
  REQUIRE(text_content(f.doc, ul) == "x");
}

TEST_CASE("replace substitutes in place", "[vdom][apply]") {
  Fixture f;
  materialize(f.doc, element("div", {}, {text("a"), element("b"), text("c")}));
  f.applier.apply(f.doc.mount(), {PatchReplace{{1}, element("i", {}, {text("B")})}});
  REQUIRE(f.applier.warnings().empty());
  REQUIRE(text_content(f.doc, f.root()) == "aBc");
  REQUIRE(f.doc.find(*f.doc.child_at(f.root(), 1))->tag == "i");
}

TEST_CASE("handler updates replace listeners", "[vdom][apply]") {
  Fixture f;
  int first = 0;
  int second = 0;
  const auto h1 = handler([&](Event &) { ++first; });
  const auto h2 = handler([&](Event &) { ++second; });

  auto before = element("button", {{"onClick", PropValue{h1}}});
  auto after = element("button", {{"onClick", PropValue{h2}}});
  materialize(f.doc, before);

  f.applier.apply(f.doc.mount(), diff(before, after));
  REQUIRE(f.doc.listener_count(f.root(), "click") == 1);
  f.doc.dispatch_event(f.root(), "click");
  REQUIRE(first == 0);
  REQUIRE(second == 1);

  f.applier.apply(f.doc.mount(), diff(after, element("button")));
  REQUIRE(f.doc.listener_count(f.root(), "click") == 0);
}

TEST_CASE("failed patches leave the document unchanged", "[vdom][apply]") {
  Fixture f;
  materialize(f.doc, text("t"));
  const auto before = f.doc.size();
  const auto subtree = element("div", {}, {text("x"), text("y")});

  for (int i = 0; i < 10; ++i) {
    f.applier.apply(f.doc.mount(), {PatchCreate{{0}, subtree}});
    REQUIRE(f.applier.warnings().size() == 1);
  }
  REQUIRE(f.doc.size() == before);

  f.applier.apply(f.doc.mount(), {PatchReplace{{}, forest({subtree})}});
  REQUIRE(f.applier.warnings().size() == 1);
  REQUIRE(f.doc.size() == before);
  REQUIRE(text_content(f.doc, f.doc.mount()) == "t");
}

TEST_CASE("half-built subtrees are destroyed", "[vdom][apply]") {
  Fixture f;
  const auto before = f.doc.size();
  f.applier.apply(
    f.doc.mount(),
    {PatchCreate{{}, element("div", {}, {text("a"), element("p", {}, {element("")})})}});
  REQUIRE(f.applier.warnings().size() == 1);
  REQUIRE(f.doc.size() == before);
  REQUIRE(f.doc.child_count(f.doc.mount()) == 0);
}
