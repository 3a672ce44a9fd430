#include "restore_service.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <tinyxml.h>

namespace {

size_t append_to_string(char* ptr, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

// Element name without its namespace prefix
std::string local_name(const TiXmlElement* elem) {
    std::string name = elem->Value();
    auto colon = name.find(':');
    return colon == std::string::npos ? name : name.substr(colon + 1);
}

// Depth-first search for the first element with the given local name.
const TiXmlElement* find_element(const TiXmlElement* elem, const std::string& name) {
    if (local_name(elem) == name) return elem;
    for (auto child = elem->FirstChildElement(); child != nullptr; child = child->NextSiblingElement()) {
        if (auto found = find_element(child, name)) return found;
    }
    return nullptr;
}

std::string element_text(const TiXmlElement* elem) {
    const char* text = elem->GetText();
    std::string value = text ? text : "";
    trim(value);
    return value;
}

} // namespace

std::string xml_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '&':  out += "&amp;"; break;
        case '<':  out += "&lt;"; break;
        case '>':  out += "&gt;"; break;
        case '"':  out += "&quot;"; break;
        case '\'': out += "&apos;"; break;
        default:   out += c;
        }
    }
    return out;
}

std::string build_soap_envelope(const std::string& ns, const std::string& operation,
                                const std::vector<std::pair<std::string, std::string>>& params) {
    std::string body;
    for (const auto& [name, value] : params) {
        body += fmt::format("<{0}>{1}</{0}>", name, xml_escape(value));
    }
    return fmt::format(
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
        "<soap:Envelope xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\" "
        "xmlns:xsd=\"http://www.w3.org/2001/XMLSchema\" "
        "xmlns:soap=\"http://schemas.xmlsoap.org/soap/envelope/\">"
        "<soap:Body><{0} xmlns=\"{1}\">{2}</{0}></soap:Body></soap:Envelope>",
        operation, xml_escape(ns), body);
}

Result<std::string> extract_soap_result(const std::string& body, const std::string& operation) {
    TiXmlDocument doc;
    doc.Parse(body.c_str());
    if (doc.Error() || !doc.RootElement()) {
        return Result<std::string>::Err(fmt::format("Invalid XML in {} response: {}",
                                                    operation, doc.ErrorDesc()));
    }

    if (auto fault = find_element(doc.RootElement(), "faultstring")) {
        return Result<std::string>::Err("SOAP fault: " + element_text(fault));
    }

    const std::string tag = operation + "Result";
    auto result = find_element(doc.RootElement(), tag);
    if (!result) {
        return Result<std::string>::Err("No " + tag + " element in response");
    }
    return Result<std::string>::Ok(element_text(result));
}

SoapRestoreService::SoapRestoreService(const RestoreServiceConfig& config)
    : config_(config) {
}

Result<std::string> SoapRestoreService::call(
        const std::string& operation,
        const std::vector<std::pair<std::string, std::string>>& params) {
    CURL* curl = curl_easy_init();
    if (!curl) return Result<std::string>::Err("curl_easy_init failed");

    std::string envelope = build_soap_envelope(config_.soap_namespace, operation, params);
    std::string action = fmt::format("SOAPAction: \"{}{}\"", config_.soap_namespace, operation);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: text/xml; charset=utf-8");
    headers = curl_slist_append(headers, action.c_str());

    std::string response;
    char error_buf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_URL, config_.url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, envelope.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(envelope.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(config_.timeout_secs));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buf);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return Result<std::string>::Err(fmt::format("{} request failed: {}", operation,
                                                    error_buf[0] ? error_buf : curl_easy_strerror(res)));
    }
    // SOAP faults come back as HTTP 500 with a fault body
    if (http_code != 200 && http_code != 500) {
        return Result<std::string>::Err(fmt::format("{} returned HTTP {}", operation, http_code));
    }
    return extract_soap_result(response, operation);
}

Result<std::string> SoapRestoreService::request_restore() {
    log_debug("restore-api", fmt::format("Restore(number={}, bits={}, fileType={})",
                                         config_.beams, config_.bits, config_.file_type));
    return call("Restore", {
        {"username", config_.username},
        {"pw", config_.password},
        {"number", std::to_string(config_.beams)},
        {"bits", std::to_string(config_.bits)},
        {"fileType", config_.file_type},
    });
}

Result<std::string> SoapRestoreService::query_location(const std::string& guid) {
    return call("Location", {
        {"username", config_.username},
        {"pw", config_.password},
        {"guid", guid},
    });
}
