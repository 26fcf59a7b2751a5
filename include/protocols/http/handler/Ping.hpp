#pragma once

#include "protocols/http/Router.hpp"

namespace dp::protocols::http::handler {

struct Ping {
    static model::Response handle(const request& req);
};

}
