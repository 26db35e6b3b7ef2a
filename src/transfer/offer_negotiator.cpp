#include "lanbeam/transfer/offer_negotiator.hpp"
#include "lanbeam/core/logger.hpp"
#include "lanbeam/core/utils.hpp"
#include "lanbeam/crypto/random.hpp"
#include "lanbeam/network/interfaces.hpp"
#include <algorithm>
#include <filesystem>
#include <iterator>

namespace lanbeam::transfer {

namespace {

constexpr std::size_t OFFER_ID_BYTES = 16;

core::OfferOutcome outcome_of(OfferStatus status) {
    switch (status) {
        case OfferStatus::ACCEPTED: return core::OfferOutcome::ACCEPTED;
        case OfferStatus::REJECTED: return core::OfferOutcome::REJECTED;
        default:                    return core::OfferOutcome::EXPIRED;
    }
}

std::uint64_t total_size_of(const std::vector<network::OfferedFile>& files) {
    std::uint64_t total = 0;
    for (const auto& file : files) {
        total += file.size;
    }
    return total;
}

}

OfferNegotiator::OfferNegotiator(network::PeerRegistry& registry, TransferEngine& engine,
                                 core::EventBus& events, const core::SettingsStore& settings,
                                 NegotiatorOptions options)
    : registry_(registry)
    , engine_(engine)
    , events_(events)
    , settings_(settings)
    , options_(options)
    , local_port_(0)
    , shutting_down_(false)
    , workers_closed_(false) {
}

OfferNegotiator::~OfferNegotiator() {
    shutdown();
}

core::Result OfferNegotiator::propose(const std::string& recipient, const std::vector<std::string>& paths,
                                      std::string& offer_id) {
    if (paths.empty()) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "No files to send");
    }

    auto peer = registry_.resolve(recipient);
    if (!peer) {
        return core::Result(core::ErrorCode::PEER_UNREACHABLE, "Unknown peer " + recipient);
    }

    auto endpoint = network::Endpoint::parse(peer->address);
    if (!endpoint) {
        return core::Result(core::ErrorCode::PEER_UNREACHABLE, "Bad peer address " + peer->address);
    }

    auto record = std::make_shared<OfferRecord>();
    record->offer.direction = OfferDirection::OUTBOUND;
    record->offer.peer = peer->address;
    record->offer.sender_name = settings_.get().username;
    record->offer.created = std::chrono::steady_clock::now();

    for (const auto& path : paths) {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec) {
            absolute = path;
        }

        auto size = core::utils::FileUtils::file_size(absolute);
        if (!core::utils::FileUtils::is_file(absolute) || !size ||
            !core::utils::FileUtils::is_readable(absolute)) {
            return core::Result(core::ErrorCode::SOURCE_UNREADABLE, "Cannot read " + path);
        }

        FileTransfer source;
        source.name = absolute.filename().string();
        source.size = *size;
        source.local_path = absolute.string();
        record->offer.files.push_back(network::OfferedFile{source.name, source.size});
        record->sources.push_back(std::move(source));
    }
    record->offer.total_size = total_size_of(record->offer.files);
    record->offer.id = crypto::SecureRandom::generate_hex(OFFER_ID_BYTES);
    record->slot = outbound_slot(peer->address);
    record->channel = std::make_shared<network::MessageChannel>();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            return core::Result(core::ErrorCode::INVALID_STATE, "Shutting down");
        }
        if (slots_.count(record->slot) > 0) {
            return core::Result(core::ErrorCode::PEER_BUSY,
                                "An offer to " + peer->address + " is already pending");
        }
        slots_.insert(record->slot);
        record->slot_held = true;
        offers_.emplace(record->offer.id, record);
    }

    auto abandon = [this, &record](core::Result failure) {
        untrack_channel(record->channel);
        std::lock_guard<std::mutex> lock(mutex_);
        release_slot_locked(*record);
        evict_locked(record->offer.id);
        return failure;
    };

    if (!track_channel(record->channel)) {
        return abandon(core::Result(core::ErrorCode::CANCELLED, "Shutting down"));
    }

    auto connected = record->channel->connect(*endpoint, options_.connect_timeout);
    if (!connected) {
        LOG_WARN("Offer to {} failed: {}", peer->address, connected.describe());
        auto code = connected.error == core::ErrorCode::CANCELLED
            ? core::ErrorCode::CANCELLED : core::ErrorCode::PEER_UNREACHABLE;
        return abandon(core::Result(code, connected.message));
    }

    network::OfferProposeMessage proposal{
        record->offer.id,
        record->offer.sender_name,
        local_port_.load(),
        record->offer.files
    };

    auto sent = record->channel->send_message(network::MessageType::OFFER_PROPOSE, proposal,
                                              options_.handshake_timeout);
    if (!sent) {
        LOG_WARN("Offer to {} could not be delivered: {}", peer->address, sent.describe());
        auto code = sent.error == core::ErrorCode::CANCELLED
            ? core::ErrorCode::CANCELLED : core::ErrorCode::PEER_UNREACHABLE;
        return abandon(core::Result(code, sent.message));
    }

    offer_id = record->offer.id;
    LOG_INFO("Offered {} file(s) ({}) to '{}' at {} as {}", record->offer.files.size(),
             core::utils::StringUtils::format_bytes(record->offer.total_size),
             peer->username, peer->address, offer_id);

    spawn_worker([this, record]() { run_outbound(record); });
    return core::Result();
}

core::Result OfferNegotiator::accept(const std::string& offer_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = offers_.find(offer_id);
    if (it == offers_.end() ||
        it->second->offer.direction != OfferDirection::INBOUND ||
        it->second->offer.status != OfferStatus::PROPOSED) {
        return core::Result(core::ErrorCode::UNKNOWN_OFFER, "No pending offer " + offer_id);
    }

    it->second->offer.status = OfferStatus::ACCEPTED;
    decision_cv_.notify_all();

    LOG_INFO("Accepted offer {} from {}", offer_id, it->second->offer.peer);
    return core::Result();
}

core::Result OfferNegotiator::reject(const std::string& offer_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = offers_.find(offer_id);
    if (it == offers_.end() ||
        it->second->offer.direction != OfferDirection::INBOUND ||
        it->second->offer.status != OfferStatus::PROPOSED) {
        return core::Result(core::ErrorCode::UNKNOWN_OFFER, "No pending offer " + offer_id);
    }

    auto record = it->second;
    record->offer.status = OfferStatus::REJECTED;
    release_slot_locked(*record);
    evict_locked(offer_id);
    decision_cv_.notify_all();

    LOG_INFO("Rejected offer {} from {}", offer_id, record->offer.peer);
    return core::Result();
}

std::vector<FileOffer> OfferNegotiator::active_offers() const {
    std::vector<FileOffer> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, record] : offers_) {
            if (!record->offer.is_terminal()) {
                result.push_back(record->offer);
            }
        }
    }

    std::sort(result.begin(), result.end(), [](const FileOffer& a, const FileOffer& b) {
        return a.created < b.created;
    });
    return result;
}

std::optional<FileOffer> OfferNegotiator::find_offer(const std::string& offer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = offers_.find(offer_id);
    if (it == offers_.end()) {
        return std::nullopt;
    }
    return it->second->offer;
}

void OfferNegotiator::handle_connection(network::tcp::socket socket) {
    auto channel = std::make_shared<network::MessageChannel>(std::move(socket));
    if (!track_channel(channel)) {
        return;
    }
    spawn_worker([this, channel]() { run_inbound(channel); });
}

void OfferNegotiator::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!shutting_down_) {
            LOG_INFO("Shutting down offer negotiator ({} active offer(s))", offers_.size());
        }
        shutting_down_ = true;
        for (const auto& channel : channels_) {
            channel->cancel();
        }
    }
    decision_cv_.notify_all();

    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_closed_ = true;
        workers.swap(workers_);
    }

    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void OfferNegotiator::run_outbound(std::shared_ptr<OfferRecord> record) {
    const auto& id = record->offer.id;
    auto wait = options_.proposal_timeout + options_.response_grace;

    network::Frame frame;
    auto received = record->channel->receive(frame, wait);

    if (!received) {
        std::string reason;
        switch (received.error) {
            case core::ErrorCode::STALL_TIMEOUT: reason = "timeout"; break;
            case core::ErrorCode::CANCELLED:     reason = "cancelled"; break;
            case core::ErrorCode::PROTOCOL_VIOLATION: reason = "protocol_error"; break;
            default:                             reason = "disconnected"; break;
        }
        LOG_WARN("No answer to offer {}: {}", id, received.describe());
        resolve_outbound(record, OfferStatus::EXPIRED, reason);
        untrack_channel(record->channel);
        return;
    }

    std::optional<network::OfferResponseMessage> response;
    if (frame.header.type == network::MessageType::OFFER_RESPONSE) {
        try {
            response = network::OfferResponseMessage::deserialize(frame.payload);
        } catch (const std::exception& e) {
            LOG_WARN("Malformed response to offer {}: {}", id, e.what());
        }
    }

    if (!response || response->offer_id != id) {
        LOG_WARN("Unexpected {} in reply to offer {}", network::to_string(frame.header.type), id);
        resolve_outbound(record, OfferStatus::EXPIRED, "protocol_error");
        untrack_channel(record->channel);
        return;
    }

    switch (response->reply) {
        case network::OfferReply::DECLINED:
            resolve_outbound(record, OfferStatus::REJECTED, "declined");
            break;
        case network::OfferReply::BUSY:
            resolve_outbound(record, OfferStatus::REJECTED, "busy");
            break;
        case network::OfferReply::EXPIRED:
            resolve_outbound(record, OfferStatus::EXPIRED, "expired");
            break;
        case network::OfferReply::ACCEPTED: {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                record->offer.status = OfferStatus::ACCEPTED;
            }
            LOG_INFO("Offer {} accepted by {}", id, record->offer.peer);
            events_.publish(core::OfferResolvedEvent{id, record->offer.peer, core::OfferOutcome::ACCEPTED, ""});

            engine_.run_sender(id, *record->channel, record->sources, [this, &record]() { settle(*record); });
            break;
        }
    }

    untrack_channel(record->channel);
}

void OfferNegotiator::run_inbound(std::shared_ptr<network::MessageChannel> channel) {
    network::Frame frame;
    auto received = channel->receive(frame, options_.handshake_timeout);
    if (!received) {
        LOG_WARN("Dropping inbound connection from {}: {}", channel->remote_address(), received.describe());
        untrack_channel(channel);
        return;
    }

    if (frame.header.type != network::MessageType::OFFER_PROPOSE) {
        LOG_WARN("Expected OFFER_PROPOSE from {}, got {}", channel->remote_address(),
                 network::to_string(frame.header.type));
        untrack_channel(channel);
        return;
    }

    network::OfferProposeMessage proposal;
    try {
        proposal = network::OfferProposeMessage::deserialize(frame.payload);
    } catch (const std::exception& e) {
        LOG_WARN("Malformed offer from {}: {}", channel->remote_address(), e.what());
        untrack_channel(channel);
        return;
    }

    auto reply = [&](network::OfferReply answer) {
        network::OfferResponseMessage response{proposal.offer_id, answer};
        auto sent = channel->send_message(network::MessageType::OFFER_RESPONSE, response,
                                          options_.handshake_timeout);
        if (!sent) {
            LOG_WARN("Could not answer offer {}: {}", proposal.offer_id, sent.describe());
        }
        return sent;
    };

    if (proposal.offer_id.empty() || proposal.files.empty()) {
        LOG_WARN("Declining empty offer from {}", channel->remote_address());
        reply(network::OfferReply::DECLINED);
        untrack_channel(channel);
        return;
    }

    auto record = std::make_shared<OfferRecord>();
    record->offer.id = proposal.offer_id;
    record->offer.direction = OfferDirection::INBOUND;
    record->offer.peer = network::Endpoint{channel->remote_address(), proposal.sender_port}.to_string();
    record->offer.sender_name = proposal.sender_name;
    record->offer.files = proposal.files;
    record->offer.total_size = total_size_of(proposal.files);
    record->offer.created = std::chrono::steady_clock::now();
    record->slot = inbound_slot(record->offer.peer);
    record->channel = channel;

    bool busy = false;
    bool stopping = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping = shutting_down_;
        busy = slots_.count(record->slot) > 0 || offers_.count(record->offer.id) > 0;
        if (!busy && !stopping) {
            slots_.insert(record->slot);
            record->slot_held = true;
            offers_.emplace(record->offer.id, record);
        }
    }

    if (stopping) {
        untrack_channel(channel);
        return;
    }

    if (busy) {
        LOG_INFO("Answering offer {} from {} as busy", proposal.offer_id, record->offer.peer);
        reply(network::OfferReply::BUSY);
        untrack_channel(channel);
        return;
    }

    LOG_INFO("Offer {} from '{}' at {}: {} file(s), {}", record->offer.id, record->offer.sender_name,
             record->offer.peer, record->offer.files.size(),
             core::utils::StringUtils::format_bytes(record->offer.total_size));

    events_.publish(core::FileOfferEvent{record->offer.id, record->offer.peer, record->offer.sender_name,
                                         record->offer.files, record->offer.total_size});

    OfferStatus decision;
    bool cancelled = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        decision_cv_.wait_for(lock, options_.proposal_timeout, [&]() {
            return shutting_down_ || record->offer.status != OfferStatus::PROPOSED;
        });

        if (record->offer.status == OfferStatus::PROPOSED) {
            record->offer.status = OfferStatus::EXPIRED;
            cancelled = shutting_down_;
            release_slot_locked(*record);
            evict_locked(record->offer.id);
        }
        decision = record->offer.status;
    }

    switch (decision) {
        case OfferStatus::REJECTED:
            reply(network::OfferReply::DECLINED);
            break;

        case OfferStatus::EXPIRED:
            if (cancelled) {
                LOG_INFO("Offer {} abandoned at shutdown", record->offer.id);
            } else {
                LOG_INFO("Offer {} from {} expired without an answer", record->offer.id, record->offer.peer);
                reply(network::OfferReply::EXPIRED);
            }
            events_.publish(core::OfferResolvedEvent{record->offer.id, record->offer.peer,
                                                     core::OfferOutcome::EXPIRED,
                                                     cancelled ? "cancelled" : "timeout"});
            break;

        case OfferStatus::ACCEPTED: {
            auto sent = reply(network::OfferReply::ACCEPTED);
            if (sent) {
                engine_.run_receiver(record->offer.id, *channel, record->offer.files,
                                     [this, &record]() { settle(*record); });
            } else {
                settle(*record);
                events_.publish(core::SessionFailedEvent{record->offer.id, TransferRole::RECEIVER,
                                                         sent.error, sent.message, std::nullopt});
            }
            break;
        }

        case OfferStatus::PROPOSED:
            break;
    }

    untrack_channel(channel);
}

void OfferNegotiator::spawn_worker(std::function<void()> body) {
    reap_workers();

    auto guarded = [body = std::move(body)]() {
        try {
            body();
        } catch (const std::exception& e) {
            LOG_ERROR("Offer worker failed: {}", e.what());
        }
    };

    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        if (!workers_closed_) {
            auto done = std::make_shared<std::atomic<bool>>(false);
            std::thread thread([guarded, done]() {
                guarded();
                done->store(true);
            });
            workers_.push_back(Worker{std::move(thread), done});
            return;
        }
    }

    // Shutdown already joined the pool; the channel is cancelled, so the
    // body returns promptly.
    guarded();
}

void OfferNegotiator::reap_workers() {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        auto it = std::partition(workers_.begin(), workers_.end(), [](const Worker& worker) {
            return !worker.done->load();
        });
        std::move(it, workers_.end(), std::back_inserter(finished));
        workers_.erase(it, workers_.end());
    }

    for (auto& worker : finished) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

bool OfferNegotiator::track_channel(const std::shared_ptr<network::MessageChannel>& channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_) {
        channel->cancel();
        return false;
    }
    channels_.insert(channel);
    return true;
}

void OfferNegotiator::untrack_channel(const std::shared_ptr<network::MessageChannel>& channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    channels_.erase(channel);
}

void OfferNegotiator::release_slot_locked(OfferRecord& record) {
    if (record.slot_held) {
        slots_.erase(record.slot);
        record.slot_held = false;
    }
}

void OfferNegotiator::evict_locked(const std::string& offer_id) {
    offers_.erase(offer_id);
}

void OfferNegotiator::settle(OfferRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    release_slot_locked(record);
    evict_locked(record.offer.id);
}

void OfferNegotiator::resolve_outbound(const std::shared_ptr<OfferRecord>& record, OfferStatus status,
                                       const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record->offer.status = status;
        release_slot_locked(*record);
        evict_locked(record->offer.id);
    }

    LOG_INFO("Offer {} to {} {} ({})", record->offer.id, record->offer.peer, to_string(status), reason);
    events_.publish(core::OfferResolvedEvent{record->offer.id, record->offer.peer, outcome_of(status), reason});
}

}
