#pragma once

#include "ssp_errors.h"
#include "ssp_ring_buffer.h"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <variant>

namespace ssp {

// Message payload: none, an integer (seek offset) or a flag
using Payload = std::variant<std::monostate, int64_t, bool>;

// One delivered message. Each recipient gets its own instance; the sender
// may wait on it until the recipient calls SetHandled().
class Message {
public:
    Message(std::string kind, Payload payload, std::string source);

    const std::string& Kind() const { return m_kind; }
    const Payload& Data() const { return m_payload; }
    const std::string& Source() const { return m_source; }

    // Payload accessors; fallback when the payload holds another type
    int64_t IntData(int64_t fallback = 0) const;

    void SetHandled();
    bool IsHandled() const;

    // Block until handled. Returns the handled flag (false on timeout).
    bool Wait(Timeout timeout);

private:
    std::string m_kind;
    Payload m_payload;
    std::string m_source;

    mutable std::mutex m_mutex;
    std::condition_variable m_handled_cv;
    bool m_handled = false;
};

using MessagePtr = std::shared_ptr<Message>;

class MessageBroker;

// Named endpoint with one FIFO queue per message kind.
// Every operation after Close() fails with MailboxClosed.
class Mailbox {
public:
    // Created through MessageBroker::Register
    Mailbox(std::string name, MessageBroker* broker);
    ~Mailbox();

    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;

    const std::string& Name() const { return m_name; }

    Result<void> Subscribe(const std::string& kind);
    Result<void> Unsubscribe(const std::string& kind);

    // Broadcast to subscribers of kind, or deliver directly to target.
    // wait_handled blocks until every recipient handled its copy.
    Result<void> Send(const std::string& kind, Payload payload = {},
                      const std::optional<std::string>& target = std::nullopt,
                      bool wait_handled = false, Timeout timeout = std::nullopt);

    // Oldest message of kind (optionally only from source).
    // leave=true peeks without removing. A non-blocking get with nothing
    // queued returns nullptr; a blocking get that times out fails with
    // MailboxTimeout.
    Result<MessagePtr> Get(const std::string& kind, bool block,
                           Timeout timeout = std::nullopt,
                           const std::optional<std::string>& source = std::nullopt,
                           bool leave = false);

    // Block until a message of kind arrives. Unless leave is set the
    // message is marked handled and discarded.
    Result<void> WaitOnMsg(const std::string& kind,
                           const std::optional<std::string>& source = std::nullopt,
                           Timeout timeout = std::nullopt, bool leave = false);

    // Mark pending messages handled, wake all waiters, deregister. Idempotent.
    void Close();
    bool IsClosed() const;

private:
    friend class MessageBroker;

    Result<MessagePtr> deliver(const std::string& kind, Payload payload, const std::string& source);

    const std::string m_name;
    MessageBroker* m_broker;  // outlives every mailbox it registered

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<std::string, std::deque<MessagePtr>> m_queues;
    bool m_closed = false;
};

// Registry of mailboxes and kind subscriptions
class MessageBroker {
public:
    MessageBroker() = default;
    ~MessageBroker() = default;

    MessageBroker(const MessageBroker&) = delete;
    MessageBroker& operator=(const MessageBroker&) = delete;

    // RegistrationFailed if the name is taken
    Result<std::shared_ptr<Mailbox>> Register(const std::string& name);

    Result<void> Send(const std::string& kind, Payload payload, const std::string& source,
                      const std::optional<std::string>& target, bool wait_handled,
                      Timeout timeout);

    bool HasMailbox(const std::string& name) const;
    size_t SubscriberCount(const std::string& kind) const;

private:
    friend class Mailbox;

    void subscribe(const std::string& mailbox, const std::string& kind);
    Result<void> unsubscribe(const std::string& mailbox, const std::string& kind);
    void deregister(const std::string& mailbox);

    mutable std::mutex m_mutex;
    // weak: mailboxes are owned by their users, Close() deregisters
    std::map<std::string, std::weak_ptr<Mailbox>> m_mailboxes;
    std::map<std::string, std::set<std::string>> m_subscribers;
};

} // namespace ssp
