#include <segmented_stream_platform/ssp_message_broker.h>

#include <QLoggingCategory>

#include <chrono>
#include <vector>

Q_LOGGING_CATEGORY(sspBroker, "ssp.broker")

namespace ssp {

// ============================================================================
// Message
// ============================================================================

Message::Message(std::string kind, Payload payload, std::string source)
    : m_kind(std::move(kind))
    , m_payload(std::move(payload))
    , m_source(std::move(source)) {
}

int64_t Message::IntData(int64_t fallback) const {
    if (auto v = std::get_if<int64_t>(&m_payload)) {
        return *v;
    }
    return fallback;
}

void Message::SetHandled() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handled = true;
    }
    m_handled_cv.notify_all();
}

bool Message::IsHandled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_handled;
}

bool Message::Wait(Timeout timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (timeout) {
        return m_handled_cv.wait_for(lock, *timeout, [this] { return m_handled; });
    }
    m_handled_cv.wait(lock, [this] { return m_handled; });
    return true;
}

// ============================================================================
// Mailbox
// ============================================================================

Mailbox::Mailbox(std::string name, MessageBroker* broker)
    : m_name(std::move(name))
    , m_broker(broker) {
}

Mailbox::~Mailbox() {
    Close();
}

Result<void> Mailbox::Subscribe(const std::string& kind) {
    if (IsClosed()) {
        return Error::mailbox_closed(m_name);
    }
    m_broker->subscribe(m_name, kind);
    return Result<void>();
}

Result<void> Mailbox::Unsubscribe(const std::string& kind) {
    if (IsClosed()) {
        return Error::mailbox_closed(m_name);
    }
    return m_broker->unsubscribe(m_name, kind);
}

Result<void> Mailbox::Send(const std::string& kind, Payload payload,
                           const std::optional<std::string>& target,
                           bool wait_handled, Timeout timeout) {
    if (IsClosed()) {
        return Error::mailbox_closed(m_name);
    }
    return m_broker->Send(kind, std::move(payload), m_name, target, wait_handled, timeout);
}

Result<MessagePtr> Mailbox::deliver(const std::string& kind, Payload payload,
                                    const std::string& source) {
    auto msg = std::make_shared<Message>(kind, std::move(payload), source);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return Error::mailbox_closed(m_name);
        }
        m_queues[kind].push_back(msg);
    }
    m_cv.notify_all();
    return msg;
}

Result<MessagePtr> Mailbox::Get(const std::string& kind, bool block, Timeout timeout,
                                const std::optional<std::string>& source, bool leave) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_closed) {
        return Error::mailbox_closed(m_name);
    }

    auto& queue = m_queues[kind];
    auto find_match = [&]() {
        for (auto it = queue.begin(); it != queue.end(); ++it) {
            if (!source || (*it)->Source() == *source) {
                return it;
            }
        }
        return queue.end();
    };

    auto deadline = std::chrono::steady_clock::now() + timeout.value_or(std::chrono::milliseconds(0));
    auto it = find_match();
    while (it == queue.end()) {
        if (!block) {
            return MessagePtr();
        }
        if (timeout) {
            if (m_cv.wait_until(lock, deadline) == std::cv_status::timeout) {
                if (m_closed) {
                    return Error::mailbox_closed(m_name);
                }
                it = find_match();
                if (it == queue.end()) {
                    return Error::mailbox_timeout(kind);
                }
                break;
            }
        } else {
            m_cv.wait(lock);
        }
        if (m_closed) {
            return Error::mailbox_closed(m_name);
        }
        it = find_match();
    }

    MessagePtr msg = *it;
    if (!leave) {
        queue.erase(it);
    }
    return msg;
}

Result<void> Mailbox::WaitOnMsg(const std::string& kind, const std::optional<std::string>& source,
                                Timeout timeout, bool leave) {
    auto got = Get(kind, true, timeout, source, leave);
    if (got.is_error()) {
        return got.error();
    }
    if (!got.value()) {
        return Error::mailbox_timeout(kind);
    }
    if (!leave) {
        got.value()->SetHandled();
    }
    return Result<void>();
}

void Mailbox::Close() {
    std::vector<MessagePtr> pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return;
        }
        m_closed = true;
        for (auto& entry : m_queues) {
            for (auto& msg : entry.second) {
                pending.push_back(msg);
            }
            entry.second.clear();
        }
    }

    // Release senders waiting on anything we will never handle
    for (auto& msg : pending) {
        msg->SetHandled();
    }
    m_cv.notify_all();
    m_broker->deregister(m_name);
    qCDebug(sspBroker, "Mailbox '%s' closed (%zu pending messages released)",
            m_name.c_str(), pending.size());
}

bool Mailbox::IsClosed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

// ============================================================================
// MessageBroker
// ============================================================================

Result<std::shared_ptr<Mailbox>> MessageBroker::Register(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_mailboxes.find(name);
    if (it != m_mailboxes.end() && !it->second.expired()) {
        return Error::registration_failed(name);
    }
    auto mailbox = std::make_shared<Mailbox>(name, this);
    m_mailboxes[name] = mailbox;
    return mailbox;
}

Result<void> MessageBroker::Send(const std::string& kind, Payload payload, const std::string& source,
                                 const std::optional<std::string>& target, bool wait_handled,
                                 Timeout timeout) {
    std::vector<std::shared_ptr<Mailbox>> recipients;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (target) {
            auto it = m_mailboxes.find(*target);
            std::shared_ptr<Mailbox> mailbox = it != m_mailboxes.end() ? it->second.lock() : nullptr;
            if (!mailbox) {
                return Error::delivery_failed("Unable to deliver '" + kind + "' to target '" + *target +
                                              "'. Target mailbox does not exist");
            }
            recipients.push_back(std::move(mailbox));
        } else {
            auto subs = m_subscribers.find(kind);
            if (subs != m_subscribers.end()) {
                for (const auto& name : subs->second) {
                    auto it = m_mailboxes.find(name);
                    if (it != m_mailboxes.end()) {
                        if (auto mailbox = it->second.lock()) {
                            recipients.push_back(std::move(mailbox));
                        }
                    }
                }
            }
            if (recipients.empty()) {
                return Error::delivery_failed("No subscribers found to deliver message '" + kind + "' to");
            }
        }
    }

    std::vector<MessagePtr> delivered;
    for (auto& mailbox : recipients) {
        auto msg = mailbox->deliver(kind, payload, source);
        if (msg.is_error()) {
            // Closed between lookup and delivery
            if (target) {
                return Error::delivery_failed("Unable to deliver '" + kind + "' to target '" + *target +
                                              "'. " + msg.error().message);
            }
            continue;
        }
        delivered.push_back(msg.value());
    }

    qCDebug(sspBroker, "'%s' from '%s' delivered to %zu mailbox(es)%s",
            kind.c_str(), source.c_str(), delivered.size(), wait_handled ? " (waiting)" : "");

    if (!wait_handled) {
        for (auto& msg : delivered) {
            msg->SetHandled();
        }
        return Result<void>();
    }

    auto deadline = std::chrono::steady_clock::now() + timeout.value_or(std::chrono::milliseconds(0));
    int not_handled = 0;
    for (auto& msg : delivered) {
        Timeout remaining = std::nullopt;
        if (timeout) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            remaining = left.count() > 0 ? left : std::chrono::milliseconds(0);
        }
        if (!msg->Wait(remaining)) {
            ++not_handled;
        }
    }
    if (not_handled > 0) {
        return Error::delivery_timeout("Timed out waiting on " + std::to_string(not_handled) +
                                       " message(s) '" + kind + "' to be handled");
    }
    return Result<void>();
}

bool MessageBroker::HasMailbox(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_mailboxes.find(name);
    return it != m_mailboxes.end() && !it->second.expired();
}

size_t MessageBroker::SubscriberCount(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_subscribers.find(kind);
    return it == m_subscribers.end() ? 0 : it->second.size();
}

void MessageBroker::subscribe(const std::string& mailbox, const std::string& kind) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_subscribers[kind].insert(mailbox);
}

Result<void> MessageBroker::unsubscribe(const std::string& mailbox, const std::string& kind) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_subscribers.find(kind);
    if (it == m_subscribers.end() || it->second.erase(mailbox) == 0) {
        return Error::not_subscribed(kind);
    }
    if (it->second.empty()) {
        m_subscribers.erase(it);
    }
    return Result<void>();
}

void MessageBroker::deregister(const std::string& mailbox) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_subscribers.begin(); it != m_subscribers.end();) {
        it->second.erase(mailbox);
        if (it->second.empty()) {
            it = m_subscribers.erase(it);
        } else {
            ++it;
        }
    }
    m_mailboxes.erase(mailbox);
}

} // namespace ssp
