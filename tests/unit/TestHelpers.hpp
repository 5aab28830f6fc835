/*
 * Shared helpers for unit tests
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include "HttpTransport.hpp"
#include "IChatProvider.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <sstream>
#include <thread>
#include <string>
#include <vector>

/**
 * Unique directory under the system temp path, removed on destruction
 */
class TempDir {
public:
    TempDir()
    {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("fleetmux-test-" + std::to_string(stamp) + "-" + std::to_string(gen()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline std::string read_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

inline void write_file(const std::filesystem::path& path, const std::string& content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

/**
 * Scripted stand-in for the HTTP transport
 *
 * Routes are keyed by "METHOD /path". Each route holds a list of responses
 * served in order; the last one repeats. Streaming requests receive the body
 * through their sink in small pieces so line reassembly is exercised.
 */
class FakeHttp {
public:
    void on(const std::string& method, const std::string& path, HttpResponse response)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_[method + " " + path].push_back(std::move(response));
    }

    void on(const std::string& method, const std::string& path, int status, const std::string& body)
    {
        HttpResponse response;
        response.status_code = status;
        response.body = body;
        on(method, path, std::move(response));
    }

    std::vector<HttpRequest> requests() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::vector<HttpRequest> requests_to(const std::string& path) const
    {
        std::vector<HttpRequest> out;
        for (const auto& request : requests()) {
            if (path_of(request.url) == path) {
                out.push_back(request);
            }
        }
        return out;
    }

    HttpClient client()
    {
        return [this](const HttpRequest& request) { return handle(request); };
    }

    std::size_t chunk_size{7};

private:
    static std::string path_of(const std::string& url)
    {
        const auto scheme = url.find("://");
        const auto start = url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
        return start == std::string::npos ? "/" : url.substr(start);
    }

    HttpResponse handle(const HttpRequest& request)
    {
        HttpResponse response;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            auto it = routes_.find(request.method + " " + path_of(request.url));
            if (it == routes_.end() || it->second.empty()) {
                response.status_code = 404;
                response.body = "not found";
                return response;
            }
            auto& queue = it->second;
            response = queue.front();
            if (queue.size() > 1) {
                queue.erase(queue.begin());
            }
        }

        if (request.cancel.is_cancelled()) {
            HttpResponse cancelled;
            cancelled.cancelled = true;
            cancelled.error = "request cancelled";
            return cancelled;
        }

        if (request.on_data && response.success()) {
            const std::string body = response.body;
            response.body.clear();
            for (std::size_t pos = 0; pos < body.size(); pos += chunk_size) {
                if (!request.on_data(body.substr(pos, chunk_size))) {
                    response.error = "transfer aborted by receiver";
                    response.aborted_by_sink = true;
                    break;
                }
            }
        }
        return response;
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<HttpResponse>> routes_;
    std::vector<HttpRequest> requests_;
};

/**
 * Scripted provider that records how it was called
 */
class FakeChatProvider : public IChatProvider {
public:
    explicit FakeChatProvider(std::string id = "fake")
        : id_(std::move(id))
    {}

    std::vector<std::string> chunks{"Hello", " world"};
    StreamMetadata metadata;
    ProviderStatus stream_status = ProviderStatus::ok();
    ProviderStatus close_status = ProviderStatus::ok();
    std::chrono::milliseconds chunk_delay{0};

    std::atomic<int> stream_calls{0};
    std::atomic<int> close_calls{0};
    std::atomic<int> unload_calls{0};
    std::atomic<int> ready_calls{0};
    std::atomic<int> list_calls{0};

    std::string id() const override { return id_; }

    ModelListResult list_loaded_models(const Host& /*host*/, const CancellationToken& /*cancel*/) override
    {
        ++list_calls;
        ModelListResult result;
        result.models = {"loaded-model"};
        return result;
    }

    ProviderStatus ensure_model_ready(const Host& /*host*/,
                                      const std::string& /*model*/,
                                      const CancellationToken& /*cancel*/) override
    {
        ++ready_calls;
        return ProviderStatus::ok();
    }

    ProviderStatus stream(const StreamRequest& request, const StreamCallbacks& callbacks) override
    {
        ++stream_calls;
        if (!stream_status.success) {
            return stream_status;
        }
        for (const auto& chunk : chunks) {
            if (chunk_delay.count() > 0) {
                std::this_thread::sleep_for(chunk_delay);
            }
            if (callbacks.on_chunk) {
                if (auto err = callbacks.on_chunk({"assistant", chunk})) {
                    return ProviderStatus::error(ProviderErrorCode::Callback, *err);
                }
            }
        }
        if (callbacks.on_complete) {
            StreamMetadata meta = metadata;
            if (meta.model.empty()) {
                meta.model = request.model;
            }
            meta.done = true;
            if (auto err = callbacks.on_complete(meta)) {
                return ProviderStatus::error(ProviderErrorCode::Callback, *err);
            }
        }
        return ProviderStatus::ok();
    }

    ProviderStatus unload_model(const Host& /*host*/,
                                const std::string& /*model*/,
                                const CancellationToken& /*cancel*/) override
    {
        ++unload_calls;
        return ProviderStatus::ok();
    }

    ProviderStatus close() override
    {
        ++close_calls;
        return close_status;
    }

private:
    std::string id_;
};

inline Host make_host(const std::string& name, const std::string& type = "ollama")
{
    Host host;
    host.name = name;
    host.url = "http://" + name + ":11434";
    host.type = type;
    return host;
}

#endif // TEST_HELPERS_HPP
