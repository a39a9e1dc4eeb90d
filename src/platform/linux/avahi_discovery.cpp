#include "network/discovery.hpp"
#include "network/discovery_record.hpp"
#include "core/logging.hpp"

#include <avahi-client/client.h>
#include <avahi-client/publish.h>
#include <avahi-client/lookup.h>
#include <avahi-common/alternative.h>
#include <avahi-common/defs.h>
#include <avahi-common/domain.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/strlst.h>
#include <avahi-common/thread-watch.h>

#include <QObject>
#include <QMetaObject>
#include <QTimer>

#include <string>
#include <unordered_map>

namespace dropline::network {

namespace {

// Holds the Avahi poll lock for a scope. Only used from the Qt thread.
class PollLock {
public:
    explicit PollLock(AvahiThreadedPoll* poll) : poll_(poll) {
        if (poll_) avahi_threaded_poll_lock(poll_);
    }
    ~PollLock() {
        if (poll_) avahi_threaded_poll_unlock(poll_);
    }
    PollLock(const PollLock&) = delete;
    PollLock& operator=(const PollLock&) = delete;

private:
    AvahiThreadedPoll* poll_;
};

std::string instance_key(const char* name, AvahiIfIndex interface, AvahiProtocol protocol) {
    return std::string(name ? name : "") + '|' + std::to_string(interface) + '|' +
           std::to_string(protocol);
}

std::vector<std::string> txt_entries(AvahiStringList* txt) {
    std::vector<std::string> entries;
    for (AvahiStringList* item = txt; item; item = avahi_string_list_get_next(item)) {
        entries.emplace_back(reinterpret_cast<const char*>(avahi_string_list_get_text(item)),
                             avahi_string_list_get_size(item));
    }
    return entries;
}

} // namespace

/**
 * Avahi-based mDNS discovery backend for Linux.
 *
 * Avahi runs its own poll thread. Every callback from that thread is posted
 * to the Qt thread through `context_` before reaching DiscoveryService.
 *
 * mDNS caches records for minutes, so a vanished peer would linger long
 * after it stopped answering. Instead the advertised TXT record carries a
 * beat counter ("t") that is bumped every advertise interval, and every
 * resolved peer's TXT record is watched; each new beat is a sighting.
 * DiscoveryService expires peers whose beats stop.
 */
class AvahiDiscoveryBackend final : public DiscoveryBackend {
public:
    explicit AvahiDiscoveryBackend(DiscoveryConfig config)
        : config_(config)
    {
        heartbeat_timer_.setInterval(static_cast<int>(config_.advertise_interval.count()));
        QObject::connect(&heartbeat_timer_, &QTimer::timeout, &context_, [this]() { beat(); });
    }

    ~AvahiDiscoveryBackend() override {
        heartbeat_timer_.stop();
        if (threaded_poll_) {
            avahi_threaded_poll_stop(threaded_poll_);
        }
        if (entry_group_) {
            avahi_entry_group_free(entry_group_);
        }
        free_watchers();
        if (browser_) {
            avahi_service_browser_free(browser_);
        }
        if (client_) {
            avahi_client_free(client_);
        }
        if (threaded_poll_) {
            avahi_threaded_poll_free(threaded_poll_);
        }
        if (service_name_) {
            avahi_free(service_name_);
        }
    }

    [[nodiscard]] const char* name() const override { return "avahi"; }

    Result<void, Error> start_advertising(const AdvertisementInfo& info) override {
        auto client = ensure_client();
        if (client.is_err()) return client;

        PollLock lock(threaded_poll_);
        advertised_ = info;
        established_ = false;
        if (service_name_) {
            avahi_free(service_name_);
        }
        service_name_ = avahi_strdup(info.device_name.left(63).toUtf8().constData());

        if (!entry_group_) {
            entry_group_ = avahi_entry_group_new(client_, entry_group_callback, this);
            if (!entry_group_) {
                return Result<void, Error>::err(Error{
                    ErrorKind::DiscoveryFailed,
                    "Failed to create entry group: " +
                        std::string(avahi_strerror(avahi_client_errno(client_)))});
            }
        } else {
            avahi_entry_group_reset(entry_group_);
        }

        auto added = add_service_locked();
        if (added.is_ok()) {
            heartbeat_timer_.start();
        }
        return added;
    }

    void stop_advertising() override {
        heartbeat_timer_.stop();
        PollLock lock(threaded_poll_);
        advertised_.reset();
        established_ = false;
        if (entry_group_) {
            avahi_entry_group_reset(entry_group_);
            avahi_entry_group_free(entry_group_);
            entry_group_ = nullptr;
        }
    }

    Result<void, Error> start_browsing() override {
        auto client = ensure_client();
        if (client.is_err()) return client;

        PollLock lock(threaded_poll_);
        if (browser_) {
            return Result<void, Error>::ok();
        }

        browser_ = avahi_service_browser_new(
            client_,
            AVAHI_IF_UNSPEC,
            AVAHI_PROTO_UNSPEC,
            DiscoveryService::SERVICE_TYPE,
            nullptr,  // domain
            static_cast<AvahiLookupFlags>(0),
            browse_callback,
            this
        );

        if (!browser_) {
            return Result<void, Error>::err(Error{
                ErrorKind::DiscoveryFailed,
                "Failed to create service browser: " +
                    std::string(avahi_strerror(avahi_client_errno(client_)))});
        }

        return Result<void, Error>::ok();
    }

    void stop_browsing() override {
        PollLock lock(threaded_poll_);
        free_watchers();
        if (browser_) {
            avahi_service_browser_free(browser_);
            browser_ = nullptr;
        }
        instances_.clear();
    }

private:
    // A resolved service instance and the watch on its TXT record.
    struct Instance {
        Endpoint endpoint;
        AvahiRecordBrowser* heartbeat = nullptr;
    };

    DiscoveryConfig config_;
    QObject context_;
    QTimer heartbeat_timer_;
    AvahiThreadedPoll* threaded_poll_ = nullptr;
    AvahiClient* client_ = nullptr;
    AvahiEntryGroup* entry_group_ = nullptr;
    AvahiServiceBrowser* browser_ = nullptr;
    char* service_name_ = nullptr;
    std::optional<AdvertisementInfo> advertised_;
    uint64_t beats_ = 0;
    bool established_ = false;  // entry group registered; under the poll lock

    // Resolved service instances (under the poll lock).
    std::unordered_map<std::string, Instance> instances_;

    Result<void, Error> ensure_client() {
        if (client_) return Result<void, Error>::ok();

        threaded_poll_ = avahi_threaded_poll_new();
        if (!threaded_poll_) {
            return Result<void, Error>::err(
                Error{ErrorKind::DiscoveryFailed, "Failed to create Avahi poll"});
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
                ErrorKind::DiscoveryFailed,
                "Failed to create Avahi client: " + std::string(avahi_strerror(error))});
        }

        if (avahi_threaded_poll_start(threaded_poll_) < 0) {
            avahi_client_free(client_);
            client_ = nullptr;
            avahi_threaded_poll_free(threaded_poll_);
            threaded_poll_ = nullptr;
            return Result<void, Error>::err(
                Error{ErrorKind::DiscoveryFailed, "Failed to start Avahi poll thread"});
        }

        return Result<void, Error>::ok();
    }

    // Caller holds the poll lock (or runs on the poll thread).
    AvahiStringList* txt_locked() const {
        AvahiStringList* txt = nullptr;
        for (const auto& entry : encode_txt_record(*advertised_)) {
            txt = avahi_string_list_add(txt, entry.c_str());
        }
        return avahi_string_list_add(txt, ("t=" + std::to_string(beats_)).c_str());
    }

    Result<void, Error> add_service_locked() {
        if (!entry_group_ || !advertised_ || !service_name_) {
            return Result<void, Error>::ok();
        }

        AvahiStringList* txt = txt_locked();

        int ret = avahi_entry_group_add_service_strlst(
            entry_group_,
            AVAHI_IF_UNSPEC,
            AVAHI_PROTO_UNSPEC,
            static_cast<AvahiPublishFlags>(0),
            service_name_,
            DiscoveryService::SERVICE_TYPE,
            nullptr,  // domain
            nullptr,  // host
            advertised_->port,
            txt
        );

        avahi_string_list_free(txt);

        if (ret == AVAHI_ERR_COLLISION) {
            rename_after_collision();
            return add_service_locked();
        }
        if (ret < 0) {
            return Result<void, Error>::err(Error{
                ErrorKind::DiscoveryFailed,
                "Failed to add service: " + std::string(avahi_strerror(ret))});
        }

        ret = avahi_entry_group_commit(entry_group_);
        if (ret < 0) {
            return Result<void, Error>::err(Error{
                ErrorKind::DiscoveryFailed,
                "Failed to commit service: " + std::string(avahi_strerror(ret))});
        }

        return Result<void, Error>::ok();
    }

    // Qt thread, every advertise interval.
    void beat() {
        PollLock lock(threaded_poll_);
        if (!entry_group_ || !advertised_ || !service_name_ || !established_) {
            return;
        }
        ++beats_;
        AvahiStringList* txt = txt_locked();
        const int ret = avahi_entry_group_update_service_txt_strlst(
            entry_group_,
            AVAHI_IF_UNSPEC,
            AVAHI_PROTO_UNSPEC,
            static_cast<AvahiPublishFlags>(0),
            service_name_,
            DiscoveryService::SERVICE_TYPE,
            nullptr,  // domain
            txt);
        avahi_string_list_free(txt);
        if (ret < 0) {
            qCDebug(droplineDiscoveryLog) << "heartbeat not published:" << avahi_strerror(ret);
        }
    }

    // Caller holds the poll lock.
    void free_watchers() {
        for (auto& [key, instance] : instances_) {
            if (instance.heartbeat) {
                avahi_record_browser_free(instance.heartbeat);
                instance.heartbeat = nullptr;
            }
        }
    }

    void watch_heartbeat(Instance& instance,
                         AvahiClient* client,
                         AvahiIfIndex interface,
                         AvahiProtocol protocol,
                         const char* name,
                         const char* type,
                         const char* domain) {
        if (instance.heartbeat) return;

        char full_name[AVAHI_DOMAIN_NAME_MAX];
        if (avahi_service_name_join(full_name, sizeof(full_name), name, type, domain) < 0) {
            qCWarning(droplineDiscoveryLog) << "cannot watch" << name;
            return;
        }
        instance.heartbeat = avahi_record_browser_new(
            client,
            interface,
            protocol,
            full_name,
            AVAHI_DNS_CLASS_IN,
            AVAHI_DNS_TYPE_TXT,
            static_cast<AvahiLookupFlags>(0),
            heartbeat_callback,
            this);
        if (!instance.heartbeat) {
            qCWarning(droplineDiscoveryLog) << "heartbeat watch failed for" << name << ":"
                                            << avahi_strerror(avahi_client_errno(client));
        }
    }

    void rename_after_collision() {
        char* alternative = avahi_alternative_service_name(service_name_);
        avahi_free(service_name_);
        service_name_ = alternative;
    }

    void post_seen(Endpoint endpoint) {
        QMetaObject::invokeMethod(&context_, [this, endpoint = std::move(endpoint)]() {
            if (on_endpoint_seen) on_endpoint_seen(endpoint);
        }, Qt::QueuedConnection);
    }

    void post_gone(DeviceId id) {
        QMetaObject::invokeMethod(&context_, [this, id]() {
            if (on_endpoint_gone) on_endpoint_gone(id);
        }, Qt::QueuedConnection);
    }

    void post_failure(std::string message) {
        QMetaObject::invokeMethod(&context_, [this, message = std::move(message)]() {
            if (on_failure) on_failure(Error{ErrorKind::DiscoveryFailed, message});
        }, Qt::QueuedConnection);
    }

    static void client_callback(AvahiClient* client, AvahiClientState state, void* userdata) {
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);

        switch (state) {
            case AVAHI_CLIENT_S_RUNNING:
                if (self->entry_group_ &&
                    avahi_entry_group_is_empty(self->entry_group_)) {
                    auto result = self->add_service_locked();
                    if (result.is_err()) {
                        self->post_failure(result.unwrap_err().message);
                    }
                }
                break;
            case AVAHI_CLIENT_FAILURE:
                self->post_failure("Avahi client failure: " +
                                   std::string(avahi_strerror(avahi_client_errno(client))));
                break;
            case AVAHI_CLIENT_S_COLLISION:
            case AVAHI_CLIENT_S_REGISTERING:
                self->established_ = false;
                if (self->entry_group_) {
                    avahi_entry_group_reset(self->entry_group_);
                }
                break;
            case AVAHI_CLIENT_CONNECTING:
                break;
        }
    }

    static void entry_group_callback(AvahiEntryGroup* group,
                                     AvahiEntryGroupState state,
                                     void* userdata) {
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);

        switch (state) {
            case AVAHI_ENTRY_GROUP_COLLISION: {
                self->established_ = false;
                self->rename_after_collision();
                avahi_entry_group_reset(group);
                auto result = self->add_service_locked();
                if (result.is_err()) {
                    self->post_failure(result.unwrap_err().message);
                }
                break;
            }
            case AVAHI_ENTRY_GROUP_FAILURE:
                self->established_ = false;
                self->post_failure("Service registration failed: " +
                                   std::string(avahi_strerror(
                                       avahi_client_errno(avahi_entry_group_get_client(group)))));
                break;
            case AVAHI_ENTRY_GROUP_ESTABLISHED:
                self->established_ = true;
                break;
            case AVAHI_ENTRY_GROUP_UNCOMMITED:
            case AVAHI_ENTRY_GROUP_REGISTERING:
                break;
        }
    }

    static void browse_callback(AvahiServiceBrowser* browser,
                                AvahiIfIndex interface,
                                AvahiProtocol protocol,
                                AvahiBrowserEvent event,
                                const char* name,
                                const char* type,
                                const char* domain,
                                AvahiLookupResultFlags flags,
                                void* userdata) {
        Q_UNUSED(flags)
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);

        switch (event) {
            case AVAHI_BROWSER_NEW:
                if (!avahi_service_resolver_new(
                        avahi_service_browser_get_client(browser),
                        interface,
                        protocol,
                        name,
                        type,
                        domain,
                        AVAHI_PROTO_INET,
                        static_cast<AvahiLookupFlags>(0),
                        resolve_callback,
                        userdata)) {
                    qCWarning(droplineDiscoveryLog) << "resolver failed for" << name;
                }
                break;

            case AVAHI_BROWSER_REMOVE: {
                auto it = self->instances_.find(instance_key(name, interface, protocol));
                if (it == self->instances_.end()) break;
                const auto id = it->second.endpoint.id;
                if (it->second.heartbeat) {
                    avahi_record_browser_free(it->second.heartbeat);
                }
                self->instances_.erase(it);
                bool still_present = false;
                for (const auto& [key, other] : self->instances_) {
                    if (other.endpoint.id == id) {
                        still_present = true;
                        break;
                    }
                }
                if (!still_present) {
                    self->post_gone(id);
                }
                break;
            }

            case AVAHI_BROWSER_FAILURE:
                self->post_failure("Service browser failure: " +
                                   std::string(avahi_strerror(avahi_client_errno(
                                       avahi_service_browser_get_client(browser)))));
                break;
            case AVAHI_BROWSER_ALL_FOR_NOW:
            case AVAHI_BROWSER_CACHE_EXHAUSTED:
                break;
        }
    }

    static void resolve_callback(AvahiServiceResolver* resolver,
                                 AvahiIfIndex interface,
                                 AvahiProtocol protocol,
                                 AvahiResolverEvent event,
                                 const char* name,
                                 const char* type,
                                 const char* domain,
                                 const char* host_name,
                                 const AvahiAddress* address,
                                 uint16_t port,
                                 AvahiStringList* txt,
                                 AvahiLookupResultFlags flags,
                                 void* userdata) {
        Q_UNUSED(host_name)
        Q_UNUSED(flags)
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);

        if (event == AVAHI_RESOLVER_FOUND && address) {
            auto info = decode_txt_record(txt_entries(txt));
            if (info.is_ok()) {
                char addr_str[AVAHI_ADDRESS_STR_MAX];
                avahi_address_snprint(addr_str, sizeof(addr_str), address);

                auto advertised = info.unwrap();
                advertised.port = port;
                auto endpoint = endpoint_from(advertised, QHostAddress(QString::fromUtf8(addr_str)));
                auto& instance = self->instances_[instance_key(name, interface, protocol)];
                instance.endpoint = endpoint;
                self->watch_heartbeat(instance, avahi_service_resolver_get_client(resolver),
                                      interface, protocol, name, type, domain);
                self->post_seen(std::move(endpoint));
            } else {
                qCDebug(droplineDiscoveryLog) << "ignored service" << name << ":"
                                              << QString::fromStdString(info.unwrap_err().message);
            }
        }

        avahi_service_resolver_free(resolver);
    }

    static void heartbeat_callback(AvahiRecordBrowser* browser,
                                   AvahiIfIndex interface,
                                   AvahiProtocol protocol,
                                   AvahiBrowserEvent event,
                                   const char* name,
                                   uint16_t clazz,
                                   uint16_t type,
                                   const void* rdata,
                                   size_t size,
                                   AvahiLookupResultFlags flags,
                                   void* userdata) {
        Q_UNUSED(interface)
        Q_UNUSED(protocol)
        Q_UNUSED(clazz)
        Q_UNUSED(type)
        Q_UNUSED(flags)
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);

        // Old beats are flushed as REMOVE; only new records matter.
        if (event != AVAHI_BROWSER_NEW) return;

        Instance* instance = nullptr;
        for (auto& [key, candidate] : self->instances_) {
            if (candidate.heartbeat == browser) {
                instance = &candidate;
                break;
            }
        }
        if (!instance) return;

        AvahiStringList* txt = nullptr;
        if (avahi_string_list_parse(rdata, size, &txt) < 0) {
            qCDebug(droplineDiscoveryLog) << "unreadable TXT record for" << name;
            return;
        }
        auto info = decode_txt_record(txt_entries(txt));
        avahi_string_list_free(txt);
        if (info.is_err() || info.unwrap().device_id != instance->endpoint.id) {
            return;
        }

        // The address and port stay as resolved.
        auto advertised = info.unwrap();
        advertised.port = instance->endpoint.port;
        instance->endpoint = endpoint_from(advertised, instance->endpoint.host);
        self->post_seen(instance->endpoint);
    }
};

std::unique_ptr<DiscoveryBackend> createAvahiBackend(const DiscoveryConfig& config) {
    return std::make_unique<AvahiDiscoveryBackend>(config);
}

} // namespace dropline::network
