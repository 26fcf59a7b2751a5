#include "protocols/http/handler/Ping.hpp"
#include "protocols/http/model/JsonApi.hpp"

using namespace dp::protocols::http;

model::Response handler::Ping::handle(const request& req) {
    return Router::makeJsonResponse(req, model::jsonapi::ping());
}
