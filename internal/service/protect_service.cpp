#include "protect_service.hpp"

#include <iostream>
#include <thread>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <nlohmann/json.hpp>

namespace service {

    namespace {

        std::string newRequestId() {
            boost::uuids::random_generator generator;
            return "Req " + boost::uuids::to_string(generator()).substr(0, 6);
        }

        std::string joinPath(const std::string &base, const std::string &path) {
            auto first = path.find_first_not_of('/');
            if (first == std::string::npos) {
                return base;
            }
            return base + "/" + path.substr(first);
        }

        std::string reasonPhrase(const int status) {
            const auto reason = http::obsolete_reason(http::int_to_status(static_cast<unsigned>(status)));
            return std::string(reason.data(), reason.size());
        }

        template <typename T>
        std::future<T> toFuture(const std::function<void(ResultCallback<T> &&)> &operation) {
            auto promise = std::make_shared<std::promise<T>>();
            auto future = promise->get_future();
            operation([promise](std::exception_ptr error, T &&value) {
                if (error) {
                    promise->set_exception(error);
                } else {
                    promise->set_value(std::move(value));
                }
            });
            return future;
        }

    }

    std::shared_ptr<ProtectService> ProtectService::Create(const ProtectServiceConfig &config) {
        auto service = std::make_shared<ProtectService>(config);
        service->initialize(config, nullptr);
        return service;
    }

    std::shared_ptr<ProtectService> ProtectService::Create(
        const ProtectServiceConfig &config, std::shared_ptr<infrastructure::HttpTransport> transport
    ) {
        auto service = std::make_shared<ProtectService>(config);
        service->initialize(config, std::move(transport));
        return service;
    }

    ProtectService::ProtectService(const ProtectServiceConfig &config):
        _host(config.get_protect_host()),
        _api_key(config.get_protect_api_key()),
        _verbose(config.get_protect_verbose())
    {}

    void ProtectService::initialize(
        const ProtectServiceConfig &config, std::shared_ptr<infrastructure::HttpTransport> transport
    ) {
        if (transport != nullptr) {
            _transport = std::move(transport);
            return;
        }
        _asio_context = AsioContext::Create(config);
        _transport = infrastructure::HttpTransport::Create(config, _asio_context->GetContext());
    }

    ProtectService::~ProtectService() {
        if (!_asio_context) {
            return;
        }
        if (!_asio_context->RunningInThisThread()) {
            _asio_context->Stop();
            return;
        }
        // the last handle went away inside one of our own handlers: the pool is stopped here
        // but joined and destroyed from outside it, once this handler has unwound
        std::cout << "ProtectService::~ProtectService released on an io thread, handing off shutdown" << std::endl;
        _asio_context->Stop();
        std::thread([context = std::move(_asio_context)]() mutable {
            context->Stop();
            context.reset();
        }).detach();
    }

    void ProtectService::Start() {
        if (_asio_context) {
            _asio_context->Start();
        }
    }

    void ProtectService::Stop() {
        if (_asio_context) {
            _asio_context->Stop();
        }
    }

    std::string ProtectService::BaseUrl() const {
        return "http://" + _host + "/proxy/protect/integration/v1";
    }

    template <domain::Fetchable T>
    void ProtectService::fetchAndCache(CacheSlot<T> &cache, ResultCallback<std::vector<T>> &&callback) {
        if (auto cached = cache.Get()) {
            std::cout << "ProtectService: returning cached result for " << T::url_suffix << std::endl;
            callback(nullptr, std::move(*cached));
            return;
        }
        std::cout << "ProtectService: loading " << T::url_suffix <<
            " data from server. Should happen only once!" << std::endl;

        auto self(shared_from_this());
        Request(
            { .path = T::url_suffix, .accepting = infrastructure::MimeType::JSON },
            [self, &cache, callback = std::move(callback)](std::exception_ptr error, std::string &&data) {
                if (error) {
                    // failures leave the slot empty so the next call fetches again
                    callback(error, {});
                    return;
                }
                std::vector<T> resources;
                try {
                    resources = domain::ParseCollection<T>(data);
                } catch (const std::exception &e) {
                    std::cout << "ProtectService: failed to decode " << T::url_suffix << ": " << e.what() << std::endl;
                    callback(std::current_exception(), {});
                    return;
                }
                cache.Set(resources);
                callback(nullptr, std::move(resources));
            }
        );
    }

    void ProtectService::Cameras(ResultCallback<std::vector<domain::Camera>> &&callback) {
        fetchAndCache(_cached_cameras, std::move(callback));
    }

    std::future<std::vector<domain::Camera>> ProtectService::Cameras() {
        return toFuture<std::vector<domain::Camera>>([this](auto &&callback) {
            Cameras(std::move(callback));
        });
    }

    void ProtectService::Liveviews(ResultCallback<std::vector<domain::Liveview>> &&callback) {
        fetchAndCache(_cached_liveviews, std::move(callback));
    }

    std::future<std::vector<domain::Liveview>> ProtectService::Liveviews() {
        return toFuture<std::vector<domain::Liveview>>([this](auto &&callback) {
            Liveviews(std::move(callback));
        });
    }

    void ProtectService::Viewports(ResultCallback<std::vector<domain::Viewport>> &&callback) {
        fetchAndCache(_cached_viewports, std::move(callback));
    }

    std::future<std::vector<domain::Viewport>> ProtectService::Viewports() {
        return toFuture<std::vector<domain::Viewport>>([this](auto &&callback) {
            Viewports(std::move(callback));
        });
    }

    void ProtectService::GetSnapshot(
        const std::string &camera, [[maybe_unused]] const bool quality, ResultCallback<std::string> &&callback
    ) {
        std::cout << "ProtectService::GetSnapshot getting snapshot for camera '" << camera << "'" << std::endl;
        auto self(shared_from_this());
        LookupCameraId(
            camera,
            [this, self, camera, callback = std::move(callback)](
                std::exception_ptr error, std::optional<std::string> &&camera_id
            ) mutable {
                if (error) {
                    callback(error, {});
                    return;
                }
                if (!camera_id) {
                    callback(std::make_exception_ptr(domain::NotFoundError("Camera", camera)), {});
                    return;
                }
                Request(
                    { .url = joinPath(BaseUrl(), "/cameras/" + *camera_id + "/snapshot") },
                    std::move(callback)
                );
            }
        );
    }

    std::future<std::string> ProtectService::GetSnapshot(const std::string &camera, const bool quality) {
        return toFuture<std::string>([this, &camera, quality](auto &&callback) {
            GetSnapshot(camera, quality, std::move(callback));
        });
    }

    void ProtectService::ChangeViewportView(
        const std::string &viewport_id, const std::string &liveview_id, DoneCallback &&callback
    ) {
        const nlohmann::json body = {{"liveview", liveview_id}};
        Request(
            {
                .path = std::string("/") + domain::Viewport::url_suffix + "/" + viewport_id,
                .method = http::verb::patch,
                .body = body.dump()
            },
            [callback = std::move(callback)](std::exception_ptr error, std::string &&) {
                callback(error);
            }
        );
    }

    std::future<void> ProtectService::ChangeViewportView(
        const std::string &viewport_id, const std::string &liveview_id
    ) {
        auto promise = std::make_shared<std::promise<void>>();
        auto future = promise->get_future();
        ChangeViewportView(viewport_id, liveview_id, [promise](std::exception_ptr error) {
            if (error) {
                promise->set_exception(error);
            } else {
                promise->set_value();
            }
        });
        return future;
    }

    void ProtectService::LookupCameraId(
        const std::string &name, ResultCallback<std::optional<std::string>> &&callback
    ) {
        std::cout << "ProtectService::LookupCameraId getting camera id for " << name << std::endl;
        Cameras([name, callback = std::move(callback)](
            std::exception_ptr error, std::vector<domain::Camera> &&cameras
        ) {
            if (error) {
                callback(error, std::nullopt);
                return;
            }
            callback(nullptr, domain::FindIdByName(cameras, name));
        });
    }

    std::future<std::optional<std::string>> ProtectService::LookupCameraId(const std::string &name) {
        return toFuture<std::optional<std::string>>([this, &name](auto &&callback) {
            LookupCameraId(name, std::move(callback));
        });
    }

    void ProtectService::LookupViewportId(
        const std::string &name, ResultCallback<std::optional<std::string>> &&callback
    ) {
        std::cout << "ProtectService::LookupViewportId getting viewport id for " << name << std::endl;
        Viewports([name, callback = std::move(callback)](
            std::exception_ptr error, std::vector<domain::Viewport> &&viewports
        ) {
            if (error) {
                callback(error, std::nullopt);
                return;
            }
            callback(nullptr, domain::FindIdByName(viewports, name));
        });
    }

    std::future<std::optional<std::string>> ProtectService::LookupViewportId(const std::string &name) {
        return toFuture<std::optional<std::string>>([this, &name](auto &&callback) {
            LookupViewportId(name, std::move(callback));
        });
    }

    void ProtectService::LookupLiveviewName(
        const std::string &id, ResultCallback<std::optional<std::string>> &&callback
    ) {
        std::cout << "ProtectService::LookupLiveviewName getting liveview name for " << id << std::endl;
        Liveviews([id, callback = std::move(callback)](
            std::exception_ptr error, std::vector<domain::Liveview> &&liveviews
        ) {
            if (error) {
                callback(error, std::nullopt);
                return;
            }
            callback(nullptr, domain::FindNameById(liveviews, id));
        });
    }

    std::future<std::optional<std::string>> ProtectService::LookupLiveviewName(const std::string &id) {
        return toFuture<std::optional<std::string>>([this, &id](auto &&callback) {
            LookupLiveviewName(id, std::move(callback));
        });
    }

    infrastructure::HttpHeaders ProtectService::defaultHeaders(const infrastructure::MimeType accepting) const {
        return {
            {"X-API-KEY", _api_key},
            {"Content-Type", "application/json"},
            {"Accept", infrastructure::MimeTypeString(accepting)}
        };
    }

    void ProtectService::Request(ProtectRequest &&request, ResultCallback<std::string> &&callback) {
        const auto request_id = newRequestId();
        const auto resolved = request.url ? *request.url : joinPath(BaseUrl(), request.path);
        std::cout << "ProtectService::Request [" << request_id << "] Preparing: " << resolved << std::endl;

        const auto url = infrastructure::ParseHttpUrl(resolved);
        if (!url) {
            callback(
                std::make_exception_ptr(domain::TransportError("unsupported or malformed url '" + resolved + "'")),
                {}
            );
            return;
        }

        infrastructure::HttpRequest http_request;
        http_request.method = request.method.value_or(http::verb::get);
        http_request.host = url->host;
        http_request.port = url->port;
        http_request.target = url->target;
        http_request.headers = request.headers ? std::move(*request.headers) : defaultHeaders(request.accepting);
        if (request.body) {
            http_request.body = std::move(*request.body);
        }

        if (_verbose) {
            std::cout << "ProtectService::Request [" << request_id << "] Request headers:";
            for (const auto &[name, value] : http_request.headers) {
                std::cout << " " << name << "=" << (name == "X-API-KEY" ? "<redacted>" : value);
            }
            std::cout << std::endl;
        }
        std::cout << "ProtectService::Request [" << request_id << "] Sending " <<
            http::to_string(http_request.method) << " " << resolved << std::endl;

        auto self(shared_from_this());
        _transport->AsyncSend(
            std::move(http_request),
            [this, self, request_id, callback = std::move(callback)](
                error_code ec, infrastructure::HttpResponse &&response
            ) {
                if (ec) {
                    std::cout << "ProtectService::Request [" << request_id << "] failed: " << ec.message() << std::endl;
                    callback(std::make_exception_ptr(domain::TransportError(request_id, ec)), {});
                    return;
                }
                std::cout << "ProtectService::Request [" << request_id << "] Received response: " <<
                    response.status << std::endl;
                if (response.status < 200 || response.status > 299) {
                    callback(
                        std::make_exception_ptr(domain::HttpStatusError(response.status, reasonPhrase(response.status))),
                        {}
                    );
                    return;
                }
                if (_verbose) {
                    std::cout << "ProtectService::Request [" << request_id << "] Response body (first 200 chars): " <<
                        response.body.substr(0, 200) << std::endl;
                }
                callback(nullptr, std::move(response.body));
            }
        );
    }

    std::future<std::string> ProtectService::Request(ProtectRequest &&request) {
        return toFuture<std::string>([this, &request](auto &&callback) {
            Request(std::move(request), std::move(callback));
        });
    }

}
