#include "notify/JsonLinesObserver.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace lc::notify;

void JsonLinesObserver::notify(const Event& event) {
    nlohmann::json j;
    to_json(j, event);

    std::scoped_lock lock(mutex_);
    out_ << j.dump() << '\n';
    out_.flush();
    if (!out_) throw std::runtime_error("Failed to write event to JSON stream");
}
