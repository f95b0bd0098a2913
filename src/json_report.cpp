/**
 * @file json_report.cpp
 * @brief JSON rendering for hf2 results and events (nlohmann on Linux, ArduinoJson on MCUs).
 *
 * @details
 *   Both backends emit the same keys. Numbers stay numbers (addresses,
 *   checksums and words are not hex-formatted) so scripts can do arithmetic
 *   on them without re-parsing.
 */

#include "hf2/json_report.hpp"
#include "hf2/command.hpp"

#ifdef ARDUINO

#include <ArduinoJson.hpp>
using ArduinoJson::StaticJsonDocument;
using ArduinoJson::JsonObject;
using ArduinoJson::JsonArray;

#else

#include <vector>
#include "nlohmann/json.hpp"
using nlohmann::json;

#endif

namespace hf2 {

#ifdef ARDUINO

// Room for a full-size text reply plus keys.
static constexpr size_t JSON_DOC_CAP = MAX_MESSAGE_SIZE + 512;

static void fill_data(JsonObject obj, const ResponseData& data) {
    if (const results::BinInfo* b = etl::get_if<results::BinInfo>(&data)) {
        obj["mode"]             = b->mode;
        obj["flash_page_size"]  = b->flash_page_size;
        obj["flash_num_pages"]  = b->flash_num_pages;
        obj["max_message_size"] = b->max_message_size;
        if (b->has_family_id) obj["family_id"] = b->family_id;
    } else if (const results::Text* t = etl::get_if<results::Text>(&data)) {
        obj["text"] = t->text.c_str();
    } else if (const results::Checksums* c = etl::get_if<results::Checksums>(&data)) {
        JsonArray arr = obj.createNestedArray("checksums");
        for (size_t i = 0; i < c->values.size(); ++i) arr.add(c->values[i]);
    } else if (const results::Words* w = etl::get_if<results::Words>(&data)) {
        JsonArray arr = obj.createNestedArray("words");
        for (size_t i = 0; i < w->values.size(); ++i) arr.add(w->values[i]);
    }
}

std::string to_json(const Result& result) {
    StaticJsonDocument<JSON_DOC_CAP> doc;
    JsonObject obj = doc.to<JsonObject>();

    obj["tag"]     = result.tag;
    obj["command"] = command_name(result.command);
    obj["error"]   = error_name(result.error);
    if (result.error == Error::Ok) {
        obj["status"]      = status_name(result.response.status);
        obj["status_info"] = result.response.status_info;
        fill_data(obj.createNestedObject("data"), result.response.data);
    }

    std::string out;
    serializeJson(doc, out);
    return out;
}

std::string event_json(const DiagnosticEvent& evt) {
    StaticJsonDocument<128> doc;
    JsonObject obj = doc.to<JsonObject>();
    obj["event"]   = error_name(evt.code);
    obj["channel"] = channel_name(evt.channel);
    obj["tag"]     = evt.tag;
    obj["detail"]  = evt.detail;

    std::string out;
    serializeJson(doc, out);
    return out;
}

#else

static json data_json(const ResponseData& data) {
    json j = json::object();
    if (const results::BinInfo* b = etl::get_if<results::BinInfo>(&data)) {
        j["mode"]             = b->mode;
        j["flash_page_size"]  = b->flash_page_size;
        j["flash_num_pages"]  = b->flash_num_pages;
        j["max_message_size"] = b->max_message_size;
        if (b->has_family_id) j["family_id"] = b->family_id;
    } else if (const results::Text* t = etl::get_if<results::Text>(&data)) {
        j["text"] = std::string(t->text.c_str(), t->text.size());
    } else if (const results::Checksums* c = etl::get_if<results::Checksums>(&data)) {
        j["checksums"] = std::vector<uint16_t>(c->values.begin(), c->values.end());
    } else if (const results::Words* w = etl::get_if<results::Words>(&data)) {
        j["words"] = std::vector<uint32_t>(w->values.begin(), w->values.end());
    }
    return j;
}

std::string to_json(const Result& result) {
    json j;
    j["tag"]     = result.tag;
    j["command"] = command_name(result.command);
    j["error"]   = error_name(result.error);
    if (result.error == Error::Ok) {
        j["status"]      = status_name(result.response.status);
        j["status_info"] = result.response.status_info;
        j["data"]        = data_json(result.response.data);
    }
    // device text is not guaranteed UTF-8; replace bad sequences instead of throwing
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string event_json(const DiagnosticEvent& evt) {
    json j;
    j["event"]   = error_name(evt.code);
    j["channel"] = channel_name(evt.channel);
    j["tag"]     = evt.tag;
    j["detail"]  = evt.detail;
    return j.dump();
}

#endif

} // namespace hf2
