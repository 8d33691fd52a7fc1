#pragma once

#include <arbor/vdom/apply.hpp>
#include <arbor/vdom/diff.hpp>
#include <arbor/vdom/dom.hpp>
#include <arbor/vdom/log.hpp>
#include <arbor/vdom/normalize.hpp>
#include <arbor/vdom/options.hpp>
#include <arbor/vdom/source.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace arbor::vdom {

struct ReconcileStats {
  std::size_t updates{};
  std::size_t patches_applied{};
  std::size_t patches_failed{};
};

// Owns the previously rendered canonical tree of one mount point and turns
// each new description into patches against the live document.
class Reconciler {
public:
  explicit Reconciler(Document &doc, ReconcileOptions options = {})
      : doc_{doc}, backend_{doc}, applier_{backend_},
        options_{std::move(options)} {}

  Reconciler(const Reconciler &) = delete;
  Reconciler &operator=(const Reconciler &) = delete;

  const ReconcileOptions &options() const { return options_; }

  void set_options(ReconcileOptions options) { options_ = std::move(options); }

  Document &document() { return doc_; }

  // Clears whatever is under the mount node and renders `src` from scratch.
  std::size_t mount(const Source &src) {
    const auto m = doc_.mount();
    while (const auto first = doc_.child_at(m, 0)) {
      doc_.remove_child(m, *first);
    }
    current_.reset();
    return update(src);
  }

  // Returns the number of patches applied without failure.
  std::size_t update(const Source &src) {
    auto next = normalize(src, options_);
    last_patches_ = diff(current_, next, {}, options_);
    applier_.apply(doc_.mount(), last_patches_);
    current_ = std::move(next);

    const auto failed = applier_.warnings().size();
    ++stats_.updates;
    stats_.patches_applied += last_patches_.size() - failed;
    stats_.patches_failed += failed;
    return last_patches_.size() - failed;
  }

  void unmount() { update(Source{}); }

  const std::optional<CanonicalNode> &tree() const { return current_; }

  std::optional<NodeId> rendered_root() const {
    return doc_.child_at(doc_.mount(), 0);
  }

  const std::vector<Patch> &last_patches() const { return last_patches_; }

  const std::vector<PatchWarning> &last_warnings() const {
    return applier_.warnings();
  }

  const ReconcileStats &stats() const { return stats_; }

  void cache_node(const std::string &key, CanonicalNode node) {
    cache_.insert_or_assign(key, std::move(node));
  }

  const CanonicalNode *cached_node(const std::string &key) const {
    const auto it = cache_.find(key);
    return it == cache_.end() ? nullptr : &it->second;
  }

  std::size_t cache_size() const { return cache_.size(); }

  void clear_cache() { cache_.clear(); }

private:
  Document &doc_;
  DomBackend backend_;
  PatchApplier applier_;
  ReconcileOptions options_;
  std::optional<CanonicalNode> current_;
  std::vector<Patch> last_patches_;
  std::map<std::string, CanonicalNode> cache_;
  ReconcileStats stats_;
};

} // namespace arbor::vdom
