#include <cassert>
#include "pfverify/exceptions.hpp"
#include "pfverify/receipt.hpp"

int main() {
  using namespace pfverify;

  // Root must be an object
  bool failed = false;
  try { Receipt::from_json(Json::array({1, 2})); } catch (const DecodeError&) { failed = true; }
  assert(failed);

  // Typed views
  auto r = Receipt::from_json(Json{
    {"id", "r1"},
    {"transparency", {{"rekor_url", "https://rekor.example.invalid/v1"}}},
    {"signatures", Json::array({Json{{"signer", "kms+example://k1"}}, Json{{"alg", "ed25519"}}, 7})}
  });
  assert(r.has_field("id"));
  assert(!r.has_field("ts"));
  assert(r.document().at("id") == "r1");
  assert(r.transparency().has_value());
  assert(r.transparency()->candidate_url() == Json("https://rekor.example.invalid/v1"));
  assert(r.signatures().size() == 3);
  assert(r.signatures()[0].signer == "kms+example://k1");
  assert(r.signatures()[1].signer == "");   // absent signer defaults to empty
  assert(r.signatures()[2].signer == "");   // non-object entry has no signer

  // Non-object transparency / non-array signatures are tolerated
  auto loose = Receipt::from_json(Json{{"transparency", "oops"}, {"signatures", {{"a", 1}}}});
  assert(!loose.transparency().has_value());
  assert(loose.signatures().empty());

  // Candidate selection
  TransparencyBlock b;
  assert(!b.candidate_url());
  b.mirror_urls = Json::array();
  assert(!b.candidate_url());
  b.mirror_urls = Json::array({"https://example.invalid/m1", "https://m2"});
  assert(*b.candidate_url() == "https://example.invalid/m1");
  b.rekor_url = "";   // falsy rekor_url falls through to mirrors
  assert(*b.candidate_url() == "https://example.invalid/m1");
  b.rekor_url = nullptr;
  assert(*b.candidate_url() == "https://example.invalid/m1");
  b.rekor_url = 42;   // truthy non-string wins
  assert(*b.candidate_url() == 42);
  b.mirror_urls = "not-a-list";
  b.rekor_url = std::nullopt;
  assert(!b.candidate_url());

  // Truthiness
  assert(!is_truthy(Json()));
  assert(!is_truthy(Json(false)));
  assert(!is_truthy(Json(0)));
  assert(!is_truthy(Json(0.0)));
  assert(!is_truthy(Json("")));
  assert(!is_truthy(Json::array()));
  assert(!is_truthy(Json::object()));
  assert(is_truthy(Json(true)));
  assert(is_truthy(Json(-1)));
  assert(is_truthy(Json("x")));
  assert(is_truthy(Json::array({0})));
  return 0;
}
