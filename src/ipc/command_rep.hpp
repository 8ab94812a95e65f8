#pragma once
#include <zmq.h>
#include <string>

/**
 * @brief ZeroMQ REP socket carrying JSON motion commands
 *
 * One request, one reply. Typical requests:
 * - {"cmd":"set_servo","servo":"left_arm","angle":120}
 * - {"cmd":"gesture","gesture":"wave"}
 * - {"cmd":"mood","mood":"happy"}
 * - {"cmd":"health"}
 */
struct CommandRep {
  void* ctx{nullptr};  ///< ZeroMQ context
  void* rep{nullptr};  ///< ZeroMQ REP socket
  std::string address; ///< Bound endpoint
  bool bound{false};

  /**
   * @brief Create the socket and bind it
   * @param endpoint e.g. "tcp://127.0.0.1:5555"
   */
  explicit CommandRep(const std::string& endpoint = "tcp://127.0.0.1:5555") : address(endpoint) {
    ctx = zmq_ctx_new();
    rep = zmq_socket(ctx, ZMQ_REP);
    int linger = 0;
    zmq_setsockopt(rep, ZMQ_LINGER, &linger, sizeof(linger));
    bound = (zmq_bind(rep, endpoint.c_str()) == 0);
  }

  ~CommandRep() {
    zmq_close(rep);
    zmq_ctx_term(ctx);
  }

  CommandRep(const CommandRep&) = delete;
  CommandRep& operator=(const CommandRep&) = delete;

  bool is_connected() const { return bound; }
  const std::string& get_bind_address() const { return address; }

  /**
   * @brief Wait for a request
   * @param timeout_ms Poll timeout in milliseconds
   * @return true if recv() will not block
   */
  bool wait_for_request(int timeout_ms) {
    zmq_pollitem_t items[] = {{rep, 0, ZMQ_POLLIN, 0}};
    int rc = zmq_poll(items, 1, timeout_ms);
    return rc > 0 && (items[0].revents & ZMQ_POLLIN);
  }

  /**
   * @brief Receive a request (blocking). Caller must reply.
   */
  std::string recv() {
    char buf[4096];
    int n = zmq_recv(rep, buf, sizeof(buf), 0);
    if (n > static_cast<int>(sizeof(buf))) n = sizeof(buf);
    return std::string(buf, buf + (n > 0 ? n : 0));
  }

  void reply(const std::string& s) {
    zmq_send(rep, s.data(), s.size(), 0);
  }
};
