#ifndef P2PCHAT_CHAT_NODE_HPP
#define P2PCHAT_CHAT_NODE_HPP

#include "ChatEvents.hpp"
#include "ChatSession.hpp"
#include "MessageDispatcher.hpp"
#include "Network.hpp"
#include "PeerRegistry.hpp"
#include "PresenceBroadcaster.hpp"
#include "Types.hpp"
#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

namespace p2pchat {

    /**
     * A running chat peer: one UDP socket shared by the receive loop, the
     * presence broadcaster and the user's outbound actions.
     *
     * The receive loop runs on a dedicated io thread and hands every datagram to
     * a fixed-size worker pool, so one slow handler never delays the next
     * receive. At most `maxPendingDatagrams` wait in the pool; the rest are dropped.
     */
    class ChatNode : public DatagramSender {
        public:
            ChatNode(ChatConfig config, ChatEventListener& listener);
            ~ChatNode() override;

            ChatNode(const ChatNode&) = delete;
            ChatNode& operator=(const ChatNode&) = delete;

            /**
             * Binds the socket, starts the broadcaster and the receive loop.
             * @throws BindError if the port cannot be bound
             */
            void start();

            /**
             * Stops every loop and closes the socket. Idempotent.
             */
            void stop();

            bool isRunning() const { return running.load(); }

            bool sendTo(const Message& msg, const Endpoint& to) override;

            ChatSession& session() { return chatSession; }
            PeerRegistry& peers() { return registry; }
            const ChatConfig& settings() const { return config; }

            /** Port actually bound; differs from the configured one when that was 0. */
            uint16_t localPort() const { return boundPort.load(); }

            size_t droppedDatagrams() const { return dropped.load(); }

        private:
            void doReceive();
            void onDatagram(size_t length);
            void closeSocket();

            ChatConfig config;

            boost::asio::io_context io;
            boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard;
            udp::socket socket;
            std::mutex sendMtx;

            PeerRegistry registry;
            ChatSession chatSession;
            MessageDispatcher messageDispatcher;
            std::unique_ptr<PresenceBroadcaster> broadcaster;
            std::unique_ptr<boost::asio::thread_pool> workers;

            std::array<char, MAX_DATAGRAM_SIZE + 1> recvBuf{};
            udp::endpoint remote;

            std::atomic<uint16_t> boundPort{0};
            std::atomic<size_t> pending{0};
            std::atomic<size_t> dropped{0};

            std::thread ioThread;
            std::atomic<bool> running{false};
    };

} // namespace p2pchat

#endif // P2PCHAT_CHAT_NODE_HPP
