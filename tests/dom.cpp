#include "testing.hpp"

#include <string>
#include <vector>

using namespace arbor::vdom;

TEST_CASE("document tree operations", "[vdom][dom]") {
  Document doc;
  const auto body = doc.mount();
  REQUIRE(doc.find(body)->tag == "body");
  REQUIRE(doc.child_count(body) == 0);

  const auto ul = doc.create_element("ul");
  const auto a = doc.create_element("li");
  const auto b = doc.create_element("li");
  const auto c = doc.create_element("li");
  REQUIRE_FALSE(doc.attached(ul));

  doc.append_child(body, ul);
  doc.append_child(ul, a);
  doc.append_child(ul, b);
  doc.append_child(ul, c);
  REQUIRE(doc.attached(c));
  REQUIRE(doc.child_count(ul) == 3);
  REQUIRE(doc.parent_of(b) == ul);

  SECTION("move keeps identity") {
    doc.move_child(ul, 2, 0);
    REQUIRE(doc.child_at(ul, 0) == c);
    REQUIRE(doc.child_at(ul, 1) == a);
    REQUIRE(doc.child_at(ul, 2) == b);

    doc.move_child(ul, 0, 2);
    REQUIRE(doc.child_at(ul, 0) == a);
    REQUIRE(doc.child_at(ul, 2) == c);

    REQUIRE_THROWS_AS(doc.move_child(ul, 3, 0), DomError);
  }

  SECTION("remove destroys the subtree") {
    const auto t = doc.create_text("x");
    doc.append_child(b, t);
    const auto before = doc.size();
    doc.remove_child(ul, b);
    REQUIRE(doc.size() == before - 2);
    REQUIRE_FALSE(doc.contains(b));
    REQUIRE_FALSE(doc.contains(t));
    REQUIRE(doc.child_count(ul) == 2);
    REQUIRE_THROWS_AS(doc.remove_child(ul, b), DomError);
  }

  SECTION("replace keeps the position") {
    const auto p = doc.create_element("p");
    doc.replace_child(ul, b, p);
    REQUIRE(doc.child_at(ul, 1) == p);
    REQUIRE_FALSE(doc.contains(b));
    REQUIRE(doc.parent_of(p) == ul);
  }

  SECTION("re-appending an attached node moves it") {
    doc.append_child(body, a);
    REQUIRE(doc.child_count(ul) == 2);
    REQUIRE(doc.child_at(body, 1) == a);
  }

  SECTION("structural errors") {
    const auto t = doc.create_text("x");
    REQUIRE_THROWS_AS(doc.append_child(t, a), DomError);
    REQUIRE_THROWS_AS(doc.append_child(a, ul), DomError);
    REQUIRE_THROWS_AS(doc.append_child(ul, ul), DomError);
    REQUIRE_THROWS_AS(doc.child_count(12345678), DomError);
    REQUIRE_THROWS_AS(doc.create_element(""), DomError);
    REQUIRE_THROWS_AS(doc.set_attribute(t, "id", "x"), DomError);
  }

  SECTION("detached nodes can be destroyed") {
    const auto p = doc.create_element("p");
    doc.append_child(p, doc.create_text("x"));
    const auto before = doc.size();
    doc.destroy_detached(p);
    REQUIRE(doc.size() == before - 2);
    REQUIRE_FALSE(doc.contains(p));
    REQUIRE_THROWS_AS(doc.destroy_detached(a), DomError);
    REQUIRE_THROWS_AS(doc.destroy_detached(p), DomError);
  }

  SECTION("focus is dropped with the focused node") {
    doc.focus(c);
    REQUIRE(doc.focused() == c);
    doc.move_child(ul, 2, 0);
    REQUIRE(doc.focused() == c);
    doc.remove_child(body, ul);
    REQUIRE_FALSE(doc.focused());
  }
}

TEST_CASE("listeners and dispatch", "[vdom][dom]") {
  Document doc;
  const auto outer = doc.create_element("div");
  const auto inner = doc.create_element("button");
  doc.append_child(doc.mount(), outer);
  doc.append_child(outer, inner);

  std::vector<std::string> log;
  auto on_inner = handler([&](Event &e) {
    log.push_back("inner:" + std::to_string(e.current_target == inner));
  });
  auto on_outer = handler([&](Event &e) {
    log.push_back("outer:" + std::to_string(e.target == inner));
  });

  SECTION("same handler is registered once") {
    REQUIRE(doc.add_listener(inner, "click", on_inner));
    REQUIRE_FALSE(doc.add_listener(inner, "click", on_inner));
    REQUIRE(doc.listener_count(inner, "click") == 1);
    REQUIRE(doc.remove_listener(inner, "click", on_inner));
    REQUIRE_FALSE(doc.remove_listener(inner, "click", on_inner));
    REQUIRE(doc.listener_count(inner, "click") == 0);
  }

  SECTION("events bubble to ancestors") {
    doc.add_listener(inner, "click", on_inner);
    doc.add_listener(outer, "click", on_outer);
    REQUIRE(doc.dispatch_event(inner, "click"));
    REQUIRE(log == std::vector<std::string>{"inner:1", "outer:1"});
    REQUIRE_FALSE(doc.dispatch_event(inner, "keydown"));
  }

  SECTION("propagation can be stopped") {
    doc.add_listener(
      inner, "click", handler([](Event &e) { e.stop_propagation(); }));
    doc.add_listener(outer, "click", on_outer);
    REQUIRE(doc.dispatch_event(inner, "click"));
    REQUIRE(log.empty());
  }
}

TEST_CASE("style and event name helpers", "[vdom][dom]") {
  REQUIRE(event_type_for_prop("onClick") == "click");
  REQUIRE(event_type_for_prop("onMouseDown") == "mousedown");
  REQUIRE(is_event_prop("onClick"));
  REQUIRE_FALSE(is_event_prop("one"));
  REQUIRE_FALSE(is_event_prop("on1"));
  REQUIRE_FALSE(is_event_prop("on"));

  auto style = parse_style(" color: red ;margin:0; bogus; : x; width: 10px");
  REQUIRE(
    style == std::map<std::string, std::string>{
          {"color", "red"}, {"margin", "0"}, {"width", "10px"}});
  REQUIRE(parse_style("").empty());
}

TEST_CASE("backend materializes canonical nodes", "[vdom][dom]") {
  Document doc;
  DomBackend backend{doc};
  const auto h = handler([](Event &) {});

  auto tree = element(
    "div",
    {{"className", PropValue{std::string{"box"}}},
    {"style", PropValue{std::string{"color: red; margin: 0"}}},
    {"disabled", PropValue{true}},
    {"hidden", PropValue{false}},
    {"tabIndex", PropValue{std::int64_t{3}}},
    {"ratio", PropValue{0.5}},
    {"onClick", PropValue{h}}},
    {text("hi"), forest({text("a"), element("b")})});

  const auto id = backend.create_node(tree);
  doc.append_child(doc.mount(), id);

  const auto *n = doc.find(id);
  REQUIRE(n->class_name == "box");
  REQUIRE(n->style.at("color") == "red");
  REQUIRE(doc.attribute(id, "disabled") == std::string{});
  REQUIRE_FALSE(doc.attribute(id, "hidden"));
  REQUIRE(doc.attribute(id, "tabIndex") == std::string{"3"});
  REQUIRE(doc.attribute(id, "ratio") == std::string{"0.5"});
  REQUIRE(doc.listener_count(id, "click") == 1);
  REQUIRE(text_content(doc, id) == "hia");

  REQUIRE(
    dump_dom(doc, doc.mount()) ==
    "body\n"
    "  div class=\"box\" disabled=\"\" ratio=\"0.5\" tabIndex=\"3\" "
    "style=\"color: red; margin: 0\" @click\n"
    "    \"hi\"\n"
    "    \"a\"\n"
    "    b\n");

  const auto before = doc.size();
  REQUIRE_THROWS_AS(backend.create_node(element("")), DomError);
  REQUIRE_THROWS_AS(
    backend.create_node(element("ul", {}, {element("li"), forest({element("")})})),
    DomError);
  REQUIRE(doc.size() == before);
}

TEST_CASE("backend prop updates", "[vdom][dom]") {
  Document doc;
  DomBackend backend{doc};
  const auto id = backend.create_node(element("input"));
  doc.append_child(doc.mount(), id);

  int first = 0;
  int second = 0;
  const auto h1 = handler([&](Event &) { ++first; });
  const auto h2 = handler([&](Event &) { ++second; });

  backend.set_prop(id, "onInput", std::nullopt, PropValue{h1});
  backend.set_prop(id, "onInput", std::nullopt, PropValue{h1});
  REQUIRE(doc.listener_count(id, "input") == 1);

  backend.set_prop(id, "onInput", PropValue{h1}, PropValue{h2});
  REQUIRE(doc.listener_count(id, "input") == 1);
  doc.dispatch_event(id, "input");
  REQUIRE(first == 0);
  REQUIRE(second == 1);

  backend.remove_prop(id, "onInput", PropValue{h2});
  REQUIRE(doc.listener_count(id, "input") == 0);

  backend.set_prop(id, "one", std::nullopt, PropValue{h1});
  REQUIRE(doc.listener_count(id, "e") == 0);
  REQUIRE_FALSE(doc.attribute(id, "one"));

  backend.set_prop(id, "class", std::nullopt, PropValue{std::string{"a b"}});
  REQUIRE(doc.find(id)->class_name == "a b");
  backend.remove_prop(id, "className", PropValue{std::string{"a b"}});
  REQUIRE(doc.find(id)->class_name.empty());

  backend.set_prop(id, "checked", std::nullopt, PropValue{true});
  REQUIRE(doc.attribute(id, "checked"));
  backend.set_prop(id, "checked", PropValue{true}, PropValue{false});
  REQUIRE_FALSE(doc.attribute(id, "checked"));

  backend.set_prop(id, "style", std::nullopt, PropValue{std::string{"a: 1"}});
  backend.remove_prop(id, "style", PropValue{std::string{"a: 1"}});
  REQUIRE(doc.find(id)->style.empty());

  backend.set_prop(id, "value", std::nullopt, PropValue{std::string{"v"}});
  backend.remove_prop(id, "value", PropValue{std::string{"v"}});
  REQUIRE_FALSE(doc.attribute(id, "value"));
}
