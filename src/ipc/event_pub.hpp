#pragma once
#include <zmq.h>
#include <string>

/**
 * @brief ZeroMQ PUB socket for motion events
 *
 * Every handled command is published on the "motion" topic as a JSON object:
 * {"t": <sec>, "cmd": <string>, "success": <bool>, "link_state": <string>}
 */
struct EventPub {
  void* ctx{nullptr};  ///< ZeroMQ context
  void* pub{nullptr};  ///< ZeroMQ PUB socket
  std::string address;
  bool bound{false};

  explicit EventPub(const std::string& endpoint = "tcp://127.0.0.1:5556") : address(endpoint) {
    ctx = zmq_ctx_new();
    pub = zmq_socket(ctx, ZMQ_PUB);
    int linger = 0;
    zmq_setsockopt(pub, ZMQ_LINGER, &linger, sizeof(linger));
    bound = (zmq_bind(pub, endpoint.c_str()) == 0);
  }

  ~EventPub() {
    zmq_close(pub);
    zmq_ctx_term(ctx);
  }

  EventPub(const EventPub&) = delete;
  EventPub& operator=(const EventPub&) = delete;

  bool is_connected() const { return bound; }
  const std::string& get_bind_address() const { return address; }

  /**
   * @brief Publish one event (topic frame, then payload frame)
   */
  void send(const std::string& s) {
    zmq_send(pub, "motion", 6, ZMQ_SNDMORE);
    zmq_send(pub, s.data(), s.size(), 0);
  }
};
