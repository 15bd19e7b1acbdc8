#pragma once
#include <nlohmann/json.hpp>

namespace common {

    // Every payload crossing the dispatch layer (params, tool results,
    // response envelopes) is a nlohmann JSON value. Insertion order is kept so
    // envelopes serialize as {"status":...,"result":...}.
    using Json = nlohmann::ordered_json;

} // namespace common
