#pragma once

#include <string>

#include "ndaxlink/core/protocol/ndax/enums.hpp"
#include "lcr/json.hpp"


namespace ndaxlink::core::protocol::ndax::schema::query {

// GetProducts / GetInstruments {"OMSId":1}
struct OmsScoped {
    std::string to_json() const {
        std::string j;
        j.reserve(16);
        j += "{\"OMSId\":";
        lcr::json::append(j, OMS_ID);
        j += "}";
        return j;
    }
};

} // namespace ndaxlink::core::protocol::ndax::schema::query
