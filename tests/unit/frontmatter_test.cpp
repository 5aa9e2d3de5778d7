#include "internal/store/frontmatter.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

namespace {

using notewatch::model::MetaValue;
using notewatch::store::ParseDocument;
using notewatch::store::SerializeDocument;

void TestParsesScalarsAndLists() {
  auto doc = ParseDocument("---\ntitle: Hello\ntags: [a, b]\n---\nBody text\n");

  assert(doc.frontmatter.Size() == 2);
  assert(*doc.frontmatter.Find("title") == MetaValue(std::string("Hello")));
  assert(*doc.frontmatter.Find("tags") == MetaValue(std::vector<std::string>{"a", "b"}));
  assert(doc.body == "Body text\n");
  assert(doc.markers.empty());
}

void TestKeysAreCaseSensitive() {
  auto doc = ParseDocument("---\nTitle: A\ntitle: b\n---\n");
  assert(doc.frontmatter.Size() == 2);
  assert(doc.frontmatter.Contains("Title"));
  assert(doc.frontmatter.Contains("title"));
  assert(doc.body.empty());
}

void TestWithoutBlockEverythingIsBody() {
  const std::string text = "# Just a note\n---\nnot: frontmatter\n";
  auto              doc  = ParseDocument(text);
  assert(doc.frontmatter.Empty());
  assert(doc.body == text);
}

void TestUnterminatedBlockIsBody() {
  const std::string text = "---\ntitle: open\nno closing marker\n";
  auto              doc  = ParseDocument(text);
  assert(doc.frontmatter.Empty());
  assert(doc.body == text);
}

void TestMalformedOrNonMapYamlIsBody() {
  const std::string list_text = "---\n- a\n- b\n---\nbody\n";
  auto              list_doc  = ParseDocument(list_text);
  assert(list_doc.frontmatter.Empty());
  assert(list_doc.body == list_text);

  const std::string broken_text = "---\nkey: [unclosed\n---\nbody\n";
  auto              broken_doc  = ParseDocument(broken_text);
  assert(broken_doc.frontmatter.Empty());
  assert(broken_doc.body == broken_text);
}

void TestEmptyBlock() {
  auto doc = ParseDocument("---\n---\nbody");
  assert(doc.frontmatter.Empty());
  assert(doc.body == "body");
}

void TestMarkersAreNotMetadata() {
  auto doc = ParseDocument("---\nstatus: draft\nprocessed_markers:\n  - code_fence:0011\n  - toc:x\n---\nbody\n");
  assert(doc.frontmatter.Size() == 1);
  assert(!doc.frontmatter.Contains("processed_markers"));
  assert(doc.markers.size() == 2);
  assert(doc.markers.count("code_fence:0011") == 1);
}

void TestSerializeWithoutMetadataWritesBodyOnly() {
  assert(SerializeDocument({}, {}, "plain body\n") == "plain body\n");
}

void TestSerializeIsReadBack() {
  notewatch::model::Frontmatter frontmatter;
  frontmatter.Set("title", std::string("Weekly: review"));
  frontmatter.Set("tags", std::vector<std::string>{"work", "notes"});

  const auto text = SerializeDocument(frontmatter, {"code_fence:abc"}, "Body\n\nSecond paragraph\n");
  assert(text.rfind("---\n", 0) == 0);
  assert(text.find("\n---\nBody\n") != std::string::npos);

  auto doc = ParseDocument(text);
  assert(doc.frontmatter == frontmatter);
  assert(doc.markers == std::set<std::string>{"code_fence:abc"});
  assert(doc.body == "Body\n\nSecond paragraph\n");

  // serializing the parsed document again is byte-identical
  assert(SerializeDocument(doc.frontmatter, doc.markers, doc.body) == text);
}

void TestNestedMapsKeepTheirShape() {
  const std::string text = "---\nauthor:\n  name: Ada\n  email: a@x\ntitle: Notes\n---\nbody\n";

  auto        doc    = ParseDocument(text);
  const auto* author = doc.frontmatter.Find("author");
  assert(author);
  const auto* nested = std::get_if<notewatch::model::NestedValue>(author);
  assert(nested);

  const auto written = SerializeDocument(doc.frontmatter, doc.markers, doc.body);
  assert(written == text);

  // a list of mappings is nested too, a list of scalars is not
  auto lists = ParseDocument("---\nlinks:\n  - url: a\n  - url: b\naliases: [x, y]\n---\n");
  assert(std::holds_alternative<notewatch::model::NestedValue>(*lists.frontmatter.Find("links")));
  assert(*lists.frontmatter.Find("aliases") == MetaValue(std::vector<std::string>{"x", "y"}));
  assert(ParseDocument(SerializeDocument(lists.frontmatter, {}, "")).frontmatter == lists.frontmatter);
}

} // namespace

int main() {
  TestParsesScalarsAndLists();
  TestKeysAreCaseSensitive();
  TestWithoutBlockEverythingIsBody();
  TestUnterminatedBlockIsBody();
  TestMalformedOrNonMapYamlIsBody();
  TestEmptyBlock();
  TestMarkersAreNotMetadata();
  TestSerializeWithoutMetadataWritesBodyOnly();
  TestSerializeIsReadBack();
  TestNestedMapsKeepTheirShape();

  std::cout << "notewatch_unit_frontmatter: pass\n";
  return 0;
}
