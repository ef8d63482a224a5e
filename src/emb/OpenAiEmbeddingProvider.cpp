#include "emb/OpenAiEmbeddingProvider.hpp"
#include "core/Errors.hpp"
#include "util/ProcUtil.hpp"
#include "util/TextUtil.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace emb {

static std::string read_all(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void write_file(const fs::path& p, const std::string& content) {
    std::ofstream f(p, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!f) throw core::UpstreamError("failed to write request file: " + p.string());
    f << content;
}

static void remove_quietly(const fs::path& p) {
    std::error_code ec;
    fs::remove(p, ec);
}

OpenAiEmbeddingProvider::Config OpenAiEmbeddingProvider::Config::from_env() {
    Config cfg;

    const char* key = std::getenv("OPENAI_API_KEY");
    if (!key || textutil::trim(key).empty()) {
        throw core::ConfigurationError("OPENAI_API_KEY is not set");
    }
    cfg.api_key = textutil::trim(key);

    const char* base = std::getenv("OPENAI_BASE_URL");
    if (base && !textutil::trim(base).empty()) cfg.base_url = textutil::trim(base);

    return cfg;
}

OpenAiEmbeddingProvider::OpenAiEmbeddingProvider(Config cfg) : cfg_(std::move(cfg)) {
    if (cfg_.api_key.empty()) throw core::ConfigurationError("embedding provider needs an api key");
    while (!cfg_.base_url.empty() && cfg_.base_url.back() == '/') cfg_.base_url.pop_back();

    if (cfg_.work_dir.empty()) {
        static std::atomic<unsigned> instance{0};
        cfg_.work_dir = fs::temp_directory_path() /
                        ("resume-index-" + std::to_string(::getpid()) + "-" + std::to_string(++instance));
        owns_work_dir_ = true;
    }
    fs::create_directories(cfg_.work_dir);
}

OpenAiEmbeddingProvider::~OpenAiEmbeddingProvider() {
    if (!owns_work_dir_) return;
    std::error_code ec;
    fs::remove_all(cfg_.work_dir, ec);
    if (ec) std::cerr << "[warn] could not remove " << cfg_.work_dir.string() << ": " << ec.message() << "\n";
}

std::string OpenAiEmbeddingProvider::run_curl_json(const std::string& payload) {
    const std::string tag = std::to_string(++call_seq_);
    const fs::path req  = cfg_.work_dir / ("embed_payload_" + tag + ".json");
    const fs::path hdr  = cfg_.work_dir / ("embed_headers_" + tag + ".txt");
    const fs::path resp = cfg_.work_dir / ("embed_response_" + tag + ".json");

    write_file(req, payload);
    // key goes through a header file so it never shows up in the process list
    write_file(hdr, "Authorization: Bearer " + cfg_.api_key + "\nContent-Type: application/json\n");
    fs::permissions(hdr, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);

    std::ostringstream cmd;
    cmd << "curl -sS -X POST "
        << "-o " << procutil::shell_quote(resp.string()) << " "
        << "-w '%{http_code}' "
        << "-H @" << procutil::shell_quote(hdr.string()) << " "
        << "--data-binary @" << procutil::shell_quote(req.string()) << " "
        << procutil::shell_quote(cfg_.base_url + "/embeddings");

    procutil::ProcResult pr = procutil::run_capture(cmd.str());

    std::string body;
    {
        std::ifstream rf(resp, std::ios::in | std::ios::binary);
        if (rf) body = read_all(rf);
    }
    remove_quietly(req);
    remove_quietly(hdr);
    remove_quietly(resp);

    if (pr.exit_code != 0) {
        throw core::UpstreamError("curl exited with code " + std::to_string(pr.exit_code) + ": " +
                                  textutil::trim(pr.output));
    }

    // -w prints the status last; anything before it is curl noise
    const std::string out = textutil::trim(pr.output);
    const std::string status = out.size() >= 3 ? out.substr(out.size() - 3) : out;
    if (status.empty() || status[0] != '2') {
        std::string detail = body;
        try {
            json j = json::parse(body);
            if (j.contains("error") && j["error"].is_object() && j["error"].contains("message") &&
                j["error"]["message"].is_string()) {
                detail = j["error"]["message"].get<std::string>();
            }
        } catch (const json::parse_error&) {
            // keep the raw body as detail
        }
        throw core::UpstreamError("embeddings endpoint returned HTTP " + status + ": " + detail);
    }

    return body;
}

std::vector<EmbeddingItem> OpenAiEmbeddingProvider::embed_batch(const std::string& model,
                                                                const std::vector<std::string>& texts) {
    if (texts.empty()) return {};

    json payload = {
        {"model", model},
        {"input", texts},
    };
    return parse_embeddings_response(run_curl_json(payload.dump()));
}

std::vector<EmbeddingItem> parse_embeddings_response(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw core::UpstreamError(std::string("embeddings response is not valid JSON: ") + e.what());
    }

    if (!j.is_object()) throw core::UpstreamError("embeddings response must be an object");

    if (j.contains("error") && !j["error"].is_null()) {
        std::string msg = "unknown error";
        if (j["error"].is_object() && j["error"].contains("message") && j["error"]["message"].is_string()) {
            msg = j["error"]["message"].get<std::string>();
        }
        throw core::UpstreamError("embeddings endpoint error: " + msg);
    }

    if (!j.contains("data") || !j["data"].is_array()) {
        throw core::UpstreamError("embeddings response has no data array");
    }

    std::vector<EmbeddingItem> items;
    items.reserve(j["data"].size());
    for (size_t i = 0; i < j["data"].size(); ++i) {
        const json& d = j["data"][i];
        if (!d.is_object() || !d.contains("index") || !d["index"].is_number_unsigned() ||
            !d.contains("embedding") || !d["embedding"].is_array()) {
            throw core::UpstreamError("embeddings response data[" + std::to_string(i) + "] is malformed");
        }

        EmbeddingItem it;
        it.index = d["index"].get<size_t>();
        it.embedding.reserve(d["embedding"].size());
        for (const auto& x : d["embedding"]) {
            if (!x.is_number()) {
                throw core::UpstreamError("embeddings response data[" + std::to_string(i) + "] has a non-numeric value");
            }
            it.embedding.push_back(x.get<float>());
        }
        items.push_back(std::move(it));
    }
    return items;
}

} // namespace emb
