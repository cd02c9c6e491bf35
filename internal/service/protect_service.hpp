#ifndef SERVICE_PROTECT_SERVICE_HPP
#define SERVICE_PROTECT_SERVICE_HPP

#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "utils/asio_context.hpp"
#include "utils/cache_slot.hpp"
#include "domain/camera.hpp"
#include "domain/liveview.hpp"
#include "domain/viewport.hpp"
#include "domain/protect_error.hpp"
#include "infrastructure/http/http_transport.hpp"

namespace service {

    struct ProtectServiceConfig:
        public AsioContextConfig,
        public infrastructure::HttpTransportConfig
    {
        // host or host:port of the controller
        [[nodiscard]] virtual std::string get_protect_host() const = 0;
        [[nodiscard]] virtual std::string get_protect_api_key() const = 0;
        // request headers and body snippets in the log
        [[nodiscard]] virtual bool get_protect_verbose() const = 0;
    };

    struct ProtectClientConfig: public ProtectServiceConfig {
        ProtectClientConfig(
            std::string protect_host, std::string protect_api_key,
            int http_request_timeout = 10, int asio_pool_size = 1, bool protect_verbose = false,
            infrastructure::HttpTransportType http_transport_type = infrastructure::HttpTransportType::BEAST
        ):
            _protect_host(std::move(protect_host)),
            _protect_api_key(std::move(protect_api_key)),
            _http_request_timeout(http_request_timeout),
            _asio_pool_size(asio_pool_size),
            _protect_verbose(protect_verbose),
            _http_transport_type(http_transport_type)
        {}
        [[nodiscard]] int get_asio_pool_size() const override {
            return _asio_pool_size;
        }
        [[nodiscard]] infrastructure::HttpTransportType get_http_transport_type() const override {
            return _http_transport_type;
        }
        [[nodiscard]] int get_http_request_timeout() const override {
            return _http_request_timeout;
        }
        [[nodiscard]] std::string get_protect_host() const override {
            return _protect_host;
        }
        [[nodiscard]] std::string get_protect_api_key() const override {
            return _protect_api_key;
        }
        [[nodiscard]] bool get_protect_verbose() const override {
            return _protect_verbose;
        }
    private:
        const std::string _protect_host;
        const std::string _protect_api_key;
        const int _http_request_timeout;
        const int _asio_pool_size;
        const bool _protect_verbose;
        const infrastructure::HttpTransportType _http_transport_type;
    };

    // error is null on success; value is default constructed otherwise
    template <typename T>
    using ResultCallback = std::function<void(std::exception_ptr, T &&)>;
    typedef std::function<void(std::exception_ptr)> DoneCallback;

    struct ProtectRequest {
        // relative to the api base url; ignored when url is set
        std::string path;
        std::optional<std::string> url = std::nullopt;
        // replaces the default api key / content type / accept headers entirely
        std::optional<infrastructure::HttpHeaders> headers = std::nullopt;
        std::optional<http::verb> method = std::nullopt;
        std::optional<std::string> body = std::nullopt;
        infrastructure::MimeType accepting = infrastructure::MimeType::JSON;
    };

    /*
     * Client for the UniFi Protect integration api (v1) of one controller.
     *
     * The camera, liveview and viewport collections are fetched on first use and kept for the
     * lifetime of the instance; nothing refreshes them. Failed fetches are not cached. Two callers
     * missing the cache at the same time both hit the server and the last decode to land is kept.
     *
     * Every network operation comes in a callback form and a future form. Callbacks run on an io
     * thread, or inline on the calling thread when the answer is already cached.
     */
    class ProtectService: public std::enable_shared_from_this<ProtectService> {
    public:
        static std::shared_ptr<ProtectService> Create(const ProtectServiceConfig &config);
        static std::shared_ptr<ProtectService> Create(
            const ProtectServiceConfig &config, std::shared_ptr<infrastructure::HttpTransport> transport
        );
        explicit ProtectService(const ProtectServiceConfig &config);
        ProtectService() = delete;
        ProtectService (const ProtectService&) = delete;
        ProtectService& operator= (const ProtectService&) = delete;
        ~ProtectService();
        void Start();
        void Stop();

        [[nodiscard]] std::string BaseUrl() const;

        void Cameras(ResultCallback<std::vector<domain::Camera>> &&callback);
        [[nodiscard]] std::future<std::vector<domain::Camera>> Cameras();
        void Liveviews(ResultCallback<std::vector<domain::Liveview>> &&callback);
        [[nodiscard]] std::future<std::vector<domain::Liveview>> Liveviews();
        void Viewports(ResultCallback<std::vector<domain::Viewport>> &&callback);
        [[nodiscard]] std::future<std::vector<domain::Viewport>> Viewports();

        // raw image bytes; fails with NotFoundError when no camera has that name. quality is
        // accepted but not sent: the request is the same either way
        void GetSnapshot(const std::string &camera, bool quality, ResultCallback<std::string> &&callback);
        [[nodiscard]] std::future<std::string> GetSnapshot(const std::string &camera, bool quality);

        // PATCH /viewers/{viewport_id} {"liveview": liveview_id}; neither id is checked first
        void ChangeViewportView(
            const std::string &viewport_id, const std::string &liveview_id, DoneCallback &&callback
        );
        [[nodiscard]] std::future<void> ChangeViewportView(
            const std::string &viewport_id, const std::string &liveview_id
        );

        // no match is an empty optional, not an error
        void LookupCameraId(const std::string &name, ResultCallback<std::optional<std::string>> &&callback);
        [[nodiscard]] std::future<std::optional<std::string>> LookupCameraId(const std::string &name);
        void LookupViewportId(const std::string &name, ResultCallback<std::optional<std::string>> &&callback);
        [[nodiscard]] std::future<std::optional<std::string>> LookupViewportId(const std::string &name);
        void LookupLiveviewName(const std::string &id, ResultCallback<std::optional<std::string>> &&callback);
        [[nodiscard]] std::future<std::optional<std::string>> LookupLiveviewName(const std::string &id);

        // body bytes of any 2xx response; TransportError or HttpStatusError otherwise
        void Request(ProtectRequest &&request, ResultCallback<std::string> &&callback);
        [[nodiscard]] std::future<std::string> Request(ProtectRequest &&request);

    private:
        void initialize(
            const ProtectServiceConfig &config, std::shared_ptr<infrastructure::HttpTransport> transport
        );
        template <domain::Fetchable T>
        void fetchAndCache(CacheSlot<T> &cache, ResultCallback<std::vector<T>> &&callback);
        [[nodiscard]] infrastructure::HttpHeaders defaultHeaders(infrastructure::MimeType accepting) const;

        const std::string _host;
        const std::string _api_key;
        const bool _verbose;

        std::shared_ptr<AsioContext> _asio_context = nullptr;
        std::shared_ptr<infrastructure::HttpTransport> _transport = nullptr;

        CacheSlot<domain::Camera> _cached_cameras;
        CacheSlot<domain::Liveview> _cached_liveviews;
        CacheSlot<domain::Viewport> _cached_viewports;
    };

}

#endif //SERVICE_PROTECT_SERVICE_HPP
