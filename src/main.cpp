#include <iostream>
#include <string>
#include <vector>

#include <arbor/vdom/reconciler.hpp>
#include <arbor/vdom/render.hpp>

using namespace arbor::vdom;

int main(int argc, char **argv) {
  ReconcileOptions options;
  if (argc > 1) {
    ParseOptionsResult parsed;
    if (!load_options_toml_file(argv[1], &parsed)) {
      std::cerr << "cannot read " << argv[1] << "\n";
      return 1;
    }
    for (const auto &e : parsed.errors) {
      std::cerr << argv[1] << ":" << e.line << ": " << e.message << "\n";
    }
    if (!parsed.errors.empty()) {
      return 1;
    }
    options = parsed.options;
  }
  apply_log_options(options);

  std::int64_t count = 0;
  std::vector<std::string> items{"alpha", "beta", "gamma"};

  auto app = [&]() {
    return node("div")
        .attr("className", "app")
        .children({
            node("h1").text("Count: " + std::to_string(count)).build(),
            node("button")
                .key("inc")
                .on("onClick", [&](Event &) { ++count; })
                .text("Inc")
                .build(),
            node("ul")
                .children_from([&](auto &list) {
                  for (const auto &item : items) {
                    list.add(node("li").key(item).text(item).build());
                  }
                })
                .build(),
        })
        .build();
  };

  Document doc;
  Reconciler reconciler{doc, options};
  const SizeF viewport{320.0f, 240.0f};

  auto dump_frame = [&]() {
    std::cout << "Patches:\n";
    dump_patches(std::cout, reconciler.last_patches());
    std::cout << "Document:\n";
    dump_dom(std::cout, doc, doc.mount());
    const auto layout = layout_document(doc, viewport);
    std::cout << "Layout:\n";
    dump_layout(std::cout, layout);
    const auto ops = build_render_ops(doc, layout);
    std::cout << "Render ops:\n";
    dump_render_ops(std::cout, ops);
    std::cout << "ASCII render:\n";
    render_ascii(std::cout, ops, viewport, 64, 16);
  };

  reconciler.mount(app());
  std::cout << "Initial tree:\n";
  if (const auto &tree = reconciler.tree()) {
    dump_tree(std::cout, *tree);
  }
  dump_frame();

  {
    const auto root = reconciler.rendered_root();
    const auto button = root ? doc.child_at(*root, 1) : std::nullopt;
    const auto handled = button && doc.dispatch_event(*button, "click");
    std::cout << "\nClick handled=" << (handled ? "true" : "false") << "\n";
    reconciler.update(app());
    dump_frame();
  }

  {
    items = {"gamma", "alpha", "delta"};
    std::cout << "\nReorder list\n";
    reconciler.update(app());
    dump_frame();
  }

  const auto &stats = reconciler.stats();
  std::cout << "\nupdates=" << stats.updates
            << " applied=" << stats.patches_applied
            << " failed=" << stats.patches_failed << "\n";
  return 0;
}
