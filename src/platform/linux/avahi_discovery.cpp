#include "network/discovery.hpp"
#include "network/resolver_set.hpp"

#ifdef LEDMARK_HAS_AVAHI

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/error.h>
#include <avahi-common/thread-watch.h>

#include <QLoggingCategory>

namespace ledmark::network {
namespace {
Q_LOGGING_CATEGORY(lmAvahiLog, "ledmark.discovery")
} // namespace

/**
 * Avahi-based mDNS browsing backend for Linux.
 *
 * Browser and resolver callbacks run on the Avahi poll thread. stop_browsing()
 * stops that thread before freeing the browser, so no callback is in flight
 * once it returns.
 *
 * Each instance keeps its resolver for the whole scan; Avahi reports
 * AVAHI_RESOLVER_FOUND again whenever the instance's address or port changes.
 */
class AvahiDiscoveryBackend : public DiscoveryBackend {
public:
    AvahiDiscoveryBackend() = default;

    ~AvahiDiscoveryBackend() override {
        stop_browsing();

        if (client_) {
            avahi_client_free(client_);
        }
        if (threaded_poll_) {
            avahi_threaded_poll_free(threaded_poll_);
        }
    }

    Result<void, Error> start_browsing(const std::string& service_type) override {
        auto client = ensure_client();
        if (client.is_err()) return client;

        avahi_threaded_poll_lock(threaded_poll_);
        browser_ = avahi_service_browser_new(
            client_,
            AVAHI_IF_UNSPEC,
            AVAHI_PROTO_INET,
            service_type.c_str(),
            nullptr,  // domain
            static_cast<AvahiLookupFlags>(0),
            browse_callback,
            this
        );
        const int err = browser_ ? AVAHI_OK : avahi_client_errno(client_);
        avahi_threaded_poll_unlock(threaded_poll_);

        if (!browser_) {
            return Result<void, Error>::err(Error{
                ErrorKind::IOFailure,
                "Failed to create service browser: " + std::string(avahi_strerror(err)), err});
        }

        if (!poll_running_) {
            if (avahi_threaded_poll_start(threaded_poll_) < 0) {
                return Result<void, Error>::err(Error{ErrorKind::IOFailure, "Failed to start Avahi poll thread"});
            }
            poll_running_ = true;
        }

        return Result<void, Error>::ok();
    }

    void stop_browsing() override {
        if (poll_running_) {
            avahi_threaded_poll_stop(threaded_poll_);
            poll_running_ = false;
        }
        resolvers_.clear();
        if (browser_) {
            avahi_service_browser_free(browser_);
            browser_ = nullptr;
        }
    }

private:
    AvahiThreadedPoll* threaded_poll_ = nullptr;
    AvahiClient* client_ = nullptr;
    AvahiServiceBrowser* browser_ = nullptr;
    bool poll_running_ = false;
    // Touched only from poll-thread callbacks, or with the poll stopped.
    ResolverSet<AvahiServiceResolver> resolvers_{[](AvahiServiceResolver* resolver) {
        if (avahi_service_resolver_free(resolver) < 0) {
            qCDebug(lmAvahiLog) << "Failed to free service resolver";
        }
    }};

    Result<void, Error> ensure_client() {
        if (client_) return Result<void, Error>::ok();

        threaded_poll_ = avahi_threaded_poll_new();
        if (!threaded_poll_) {
            return Result<void, Error>::err(Error{ErrorKind::IOFailure, "Failed to create Avahi poll"});
        }

        int error = 0;
        client_ = avahi_client_new(
            avahi_threaded_poll_get(threaded_poll_),
            static_cast<AvahiClientFlags>(0),
            client_callback,
            this,
            &error
        );

        if (!client_) {
            avahi_threaded_poll_free(threaded_poll_);
            threaded_poll_ = nullptr;
            return Result<void, Error>::err(Error{
                ErrorKind::IOFailure,
                "Failed to create Avahi client: " + std::string(avahi_strerror(error)), error});
        }

        return Result<void, Error>::ok();
    }

    static void client_callback(AvahiClient* client, AvahiClientState state, void*) {
        if (state == AVAHI_CLIENT_FAILURE) {
            qCWarning(lmAvahiLog) << "Avahi client failure:"
                                  << avahi_strerror(avahi_client_errno(client));
        }
    }

    static void browse_callback(AvahiServiceBrowser* browser,
                                AvahiIfIndex interface,
                                AvahiProtocol protocol,
                                AvahiBrowserEvent event,
                                const char* name,
                                const char* type,
                                const char* domain,
                                AvahiLookupResultFlags,
                                void* userdata) {
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);
        // name is only set for NEW and REMOVE.
        const auto key = [&] {
            return ServiceInstanceKey{.interface = interface, .protocol = protocol, .name = name};
        };

        switch (event) {
            case AVAHI_BROWSER_NEW: {
                if (self->resolvers_.contains(key())) break;
                auto* resolver = avahi_service_resolver_new(
                    self->client_,
                    interface,
                    protocol,
                    name,
                    type,
                    domain,
                    AVAHI_PROTO_INET,
                    static_cast<AvahiLookupFlags>(0),
                    resolve_callback,
                    userdata);
                if (!resolver) {
                    qCWarning(lmAvahiLog) << "Failed to resolve" << name << ":"
                                          << avahi_strerror(avahi_client_errno(self->client_));
                    break;
                }
                self->resolvers_.add(key(), resolver);
                break;
            }

            case AVAHI_BROWSER_REMOVE:
                self->resolvers_.remove(key());
                if (self->on_service_removed) {
                    self->on_service_removed(name);
                }
                break;

            case AVAHI_BROWSER_FAILURE:
                qCWarning(lmAvahiLog) << "Avahi browser failure:"
                                      << avahi_strerror(avahi_client_errno(
                                             avahi_service_browser_get_client(browser)));
                break;

            case AVAHI_BROWSER_ALL_FOR_NOW:
            case AVAHI_BROWSER_CACHE_EXHAUSTED:
                break;
        }
    }

    static void resolve_callback(AvahiServiceResolver*,
                                 AvahiIfIndex,
                                 AvahiProtocol,
                                 AvahiResolverEvent event,
                                 const char* name,
                                 const char*,
                                 const char*,
                                 const char* host_name,
                                 const AvahiAddress* address,
                                 uint16_t port,
                                 AvahiStringList*,
                                 AvahiLookupResultFlags,
                                 void* userdata) {
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);

        if (event == AVAHI_RESOLVER_FOUND) {
            DeviceRecord record;
            record.name = name;
            record.port = port;

            if (address) {
                char addr_str[AVAHI_ADDRESS_STR_MAX];
                avahi_address_snprint(addr_str, sizeof(addr_str), address);
                record.host = addr_str;
            } else {
                record.host = host_name ? host_name : "";
            }

            if (self->on_service_resolved && !record.host.empty()) {
                self->on_service_resolved(std::move(record));
            }
        } else {
            // The resolver stays registered; a later announcement may still resolve.
            qCDebug(lmAvahiLog) << "Failed to resolve" << name;
        }
    }
};

std::unique_ptr<DiscoveryBackend> createAvahiBackend() {
    return std::make_unique<AvahiDiscoveryBackend>();
}

} // namespace ledmark::network

#endif // LEDMARK_HAS_AVAHI
