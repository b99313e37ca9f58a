#pragma once

/*
================================================================================
NDAX Payload Parser Unit Tests
================================================================================

Scope and guarantees enforced by these tests:
  • Strict schema validation: required fields must be present and typed
  • Failure-safe parsing: malformed or partial JSON is rejected, never thrown
  • Tolerance where the gateway is inconsistent (numbers as strings, flags
    as 0/1, optional trailing row fields)
  • Explicit negative coverage: missing fields, wrong types, mixed rows

The parsers are exercised on simdjson DOM elements to mirror production usage.
================================================================================
*/

#include <string_view>

#include "simdjson.h"
#include "common/test_check.hpp"

namespace tests::protocol::ndax::parser {

// Parses `json` with `p`; the element stays valid while `p` lives
inline simdjson::dom::element parse_root(simdjson::dom::parser& p, std::string_view json) {
    simdjson::dom::element root;
    TEST_CHECK(!p.parse(json.data(), json.size()).get(root));
    return root;
}

} // namespace tests::protocol::ndax::parser
