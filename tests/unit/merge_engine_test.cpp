#include "internal/merge/merge_engine.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using notewatch::merge::FoldInput;
using notewatch::merge::MergeEngine;
using notewatch::model::MetaValue;
using notewatch::model::NoticeKind;
using notewatch::model::ObserverDescriptor;
using notewatch::model::ObserverResult;
using notewatch::model::ObserverStatus;

ObserverDescriptor Descriptor(const std::string& name, int priority, notewatch::model::CapabilitySet capabilities = notewatch::model::kAllCapabilities) {
  ObserverDescriptor descriptor;
  descriptor.name         = name;
  descriptor.priority     = priority;
  descriptor.capabilities = capabilities;
  return descriptor;
}

ObserverResult SetKey(const std::string& key, const std::string& value) {
  ObserverResult result;
  result.status = ObserverStatus::kModified;
  result.metadata.emplace_back(key, MetaValue(value));
  return result;
}

ObserverResult Body(const std::string& body) {
  ObserverResult result;
  result.status = ObserverStatus::kModified;
  result.body   = body;
  return result;
}

notewatch::model::Note Base() {
  notewatch::model::Note note;
  note.path         = "/notes/a.md";
  note.title        = "a";
  note.body         = "original\n";
  note.content_hash = "00000000000000aa";
  note.frontmatter.Set("status", std::string("draft"));
  return note;
}

void TestHigherPriorityWinsConflictingKey() {
  auto merged = MergeEngine::Fold(Base(), {
                                              {Descriptor("low", 1), SetKey("category", "misc")},
                                              {Descriptor("high", 10), SetKey("category", "work")},
                                          });

  assert(merged.changed);
  assert(*merged.note.frontmatter.Find("category") == MetaValue(std::string("work")));
  assert(merged.notices.size() == 1);
  assert(merged.notices[0].observer == "low");
  assert(merged.notices[0].kind == NoticeKind::kShadowed);
}

void TestEqualValuesAreNotConflicts() {
  auto merged = MergeEngine::Fold(Base(), {
                                              {Descriptor("a", 0), SetKey("category", "work")},
                                              {Descriptor("b", 0), SetKey("category", "work")},
                                          });
  assert(merged.notices.empty());
}

void TestTieKeepsRegistrationOrder() {
  auto merged = MergeEngine::Fold(Base(), {
                                              {Descriptor("first", 0), Body("first body\n")},
                                              {Descriptor("second", 0), Body("second body\n")},
                                          });

  assert(merged.note.body == "first body\n");
  assert(merged.notices.size() == 1);
  assert(merged.notices[0].observer == "second");
  assert(merged.notices[0].kind == NoticeKind::kShadowed);
}

void TestChainedBodyRewrite() {
  MergeEngine engine(Base());

  engine.Apply(Descriptor("first", 10), Body("step one\n"), Base());
  // computed from the folded note, so it applies
  auto view = engine.Current();
  engine.Apply(Descriptor("second", 0), Body("step two\n"), view);

  auto merged = engine.Finish();
  assert(merged.note.body == "step two\n");
  assert(merged.notices.empty());
  assert(merged.base_hash == "00000000000000aa");
}

void TestCapabilitiesAreEnforced() {
  MergeEngine engine(Base());

  // add_metadata cannot overwrite
  engine.Apply(Descriptor("adder", 0, notewatch::model::kAddMetadata), SetKey("status", "done"), Base());
  engine.Apply(Descriptor("adder", 0, notewatch::model::kAddMetadata), SetKey("created_at", "now"), Base());

  // no rewrite_body
  engine.Apply(Descriptor("meta_only", 0, notewatch::model::kWriteMetadata), Body("hijacked\n"), Base());

  // no delete_metadata
  ObserverResult tombstone;
  tombstone.status = ObserverStatus::kModified;
  tombstone.metadata.emplace_back("status", std::nullopt);
  engine.Apply(Descriptor("meta_only", 0, notewatch::model::kWriteMetadata), tombstone, Base());

  auto merged = engine.Finish();
  assert(*merged.note.frontmatter.Find("status") == MetaValue(std::string("draft")));
  assert(merged.note.frontmatter.Contains("created_at"));
  assert(merged.note.body == "original\n");
  assert(merged.notices.size() == 3);
  for (const auto& notice : merged.notices) assert(notice.kind == NoticeKind::kRejected);
}

void TestTombstoneDeletesKey() {
  ObserverResult tombstone;
  tombstone.status = ObserverStatus::kModified;
  tombstone.metadata.emplace_back("status", std::nullopt);

  auto merged = MergeEngine::Fold(Base(), {{Descriptor("cleaner", 0), tombstone}});
  assert(merged.changed);
  assert(!merged.note.frontmatter.Contains("status"));
}

void TestFailedResultOnlyAddsNotice() {
  auto merged = MergeEngine::Fold(Base(), {
                                              {Descriptor("broken", 5), ObserverResult::Failed("timeout")},
                                              {Descriptor("ok", 0), SetKey("checked", "yes")},
                                          });
  assert(merged.changed);
  assert(merged.note.frontmatter.Contains("checked"));
  assert(merged.notices.size() == 1);
  assert(merged.notices[0].kind == NoticeKind::kFailed);
  assert(merged.notices[0].detail == "timeout");
}

void TestMarkersAreOwnedPerObserver() {
  auto base = Base();
  base.processed_markers = std::set<std::string>{"code_fence:old", "other:keep"};

  ObserverResult result;
  result.status  = ObserverStatus::kModified;
  result.markers = std::set<std::string>{"new"};

  auto merged = MergeEngine::Fold(base, {{Descriptor("code_fence", 0), result}});
  assert(merged.changed);
  assert((merged.note.processed_markers == std::set<std::string>{"code_fence:new", "other:keep"}));
}

void TestReservedMarkerKeyIsRejected() {
  auto merged = MergeEngine::Fold(Base(), {{Descriptor("sneaky", 0), SetKey("processed_markers", "x")}});
  assert(!merged.changed);
  assert(merged.notices.size() == 1);
  assert(merged.notices[0].kind == NoticeKind::kRejected);
}

void TestNoChangeWhenResultsMatchBase() {
  auto merged = MergeEngine::Fold(Base(), {
                                              {Descriptor("same", 0), SetKey("status", "draft")},
                                              {Descriptor("quiet", 0), ObserverResult::Unchanged()},
                                          });
  assert(!merged.changed);
  assert(merged.notices.empty());
}

void TestTagsAndTopicsAreUnioned() {
  auto base = Base();
  base.frontmatter.Set("tags", std::string("work, #ideas"));
  base.frontmatter.Set("topics", std::vector<std::string>{"rust"});

  ObserverResult topics;
  topics.status = ObserverStatus::kModified;
  topics.metadata.emplace_back("topics", MetaValue(std::vector<std::string>{"cpp", "rust"}));

  auto merged = MergeEngine::Fold(base, {
                                            {Descriptor("inline_tags", 10), SetKey("tags", "home, #work")},
                                            {Descriptor("other_tags", 0), SetKey("tags", "ideas, zz")},
                                            {Descriptor("topics", 0), topics},
                                        });

  // both observers contribute, the scalar shape is kept
  assert(*merged.note.frontmatter.Find("tags") == MetaValue(std::string("home, ideas, work, zz")));
  assert(*merged.note.frontmatter.Find("topics") == MetaValue(std::vector<std::string>{"cpp", "rust"}));
  assert(merged.notices.empty());

  // a higher priority delete still owns the key
  ObserverResult tombstone;
  tombstone.status = ObserverStatus::kModified;
  tombstone.metadata.emplace_back("tags", std::nullopt);

  auto deleted = MergeEngine::Fold(base, {
                                             {Descriptor("cleaner", 10), tombstone},
                                             {Descriptor("inline_tags", 0), SetKey("tags", "home")},
                                         });
  assert(!deleted.note.frontmatter.Contains("tags"));
  assert(deleted.notices.size() == 1);
  assert(deleted.notices[0].kind == NoticeKind::kShadowed);
}

void TestExistingCreatedAtIsKept() {
  auto base = Base();
  base.frontmatter.Set("created_at", std::string("2024-01-01T00:00:00Z"));

  auto kept = MergeEngine::Fold(base, {{Descriptor("clock", 0), SetKey("created_at", "2024-06-01T00:00:00Z")}});
  assert(!kept.changed);
  assert(*kept.note.frontmatter.Find("created_at") == MetaValue(std::string("2024-01-01T00:00:00Z")));
  assert(kept.notices.empty());

  auto added = MergeEngine::Fold(Base(), {{Descriptor("clock", 0), SetKey("created_at", "2024-06-01T00:00:00Z")}});
  assert(*added.note.frontmatter.Find("created_at") == MetaValue(std::string("2024-06-01T00:00:00Z")));
}

void TestTimestampIsNeverStored() {
  auto merged = MergeEngine::Fold(Base(), {{Descriptor("legacy", 0), SetKey("timestamp", "2024-06-01")}});
  assert(!merged.changed);
  assert(!merged.note.frontmatter.Contains("timestamp"));
}

} // namespace

int main() {
  TestHigherPriorityWinsConflictingKey();
  TestEqualValuesAreNotConflicts();
  TestTieKeepsRegistrationOrder();
  TestChainedBodyRewrite();
  TestCapabilitiesAreEnforced();
  TestTombstoneDeletesKey();
  TestFailedResultOnlyAddsNotice();
  TestMarkersAreOwnedPerObserver();
  TestReservedMarkerKeyIsRejected();
  TestNoChangeWhenResultsMatchBase();
  TestTagsAndTopicsAreUnioned();
  TestExistingCreatedAtIsKept();
  TestTimestampIsNeverStored();

  std::cout << "notewatch_unit_merge_engine: pass\n";
  return 0;
}
