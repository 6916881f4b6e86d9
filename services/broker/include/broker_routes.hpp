#pragma once
#include "topic_broker.hpp"
#include "../../../shared/cpp/http/include/http_server.hpp"

// HTTP surface of the broker service:
//   POST /publish                  body: wire message      -> {"routed": n}
//   POST /subscriptions            {"topic", "group"?}      -> {"id"}
//   DELETE /subscriptions/<id>
//   GET  /poll?sub=<id>&max=<n>    -> {"messages": [...]} or 204 when empty
//   POST /ack?sub=<id>&id=<msg>
//   GET  /stats
HttpReply handle_broker_request(TopicBroker& broker, const HttpRequest& req);
