#include "../src/hw/actuator_link.hpp"
#include "../src/hw/posix_serial_port.hpp"
#include "test_rig.hpp"
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

/**
 * @brief Unit tests for ActuatorLink
 *
 * Tests include:
 * 1. Handshake and exact wire format
 * 2. Disconnected link does no I/O
 * 3. Non-existent port
 * 4. Unknown names and out-of-range angles
 * 5. Acknowledgment failures (NACK, timeout)
 * 6. Missing READY handshake
 * 7. I/O error drops the link
 * 8. close() idempotence and reconnect
 * 9. Concurrent senders never tear lines
 */
int main() {
    std::cout << "Testing ActuatorLink functionality..." << std::endl;

    // Test 1: READY handshake, then "4:170\n" for left_arm
    {
        std::cout << "Test 1: Handshake and wire format" << std::endl;

        TestRig::SimRig rig;
        assert(rig.link->state() == LinkState::Ready);
        assert(rig.link->handshake_received());
        assert(rig.logged("ready"));

        auto r = rig.link->send("left_arm", 170);
        assert(r.success);
        assert(r.error == LinkError::OK);
        assert(r.channel == 4);
        assert(r.reply == "OK");
        assert(rig.device->wire() == "4:170\n");
        assert(rig.device->position(4).value() == 170);
        assert(rig.link->last_angle(Servo::LeftArm).value() == 170);
        assert(rig.link->assumed_angle(Servo::LeftArm) == 170);

        // "head" is an alias for pan on channel 2
        assert(rig.link->send("head", 100).success);
        assert(rig.device->lines().back() == "2:100");
        assert(rig.link->last_angle(Servo::Pan).value() == 100);

        auto stats = rig.link->get_statistics();
        assert(stats.total_commands == 2);
        assert(stats.successful_commands == 2);
        assert(rig.link->recent_commands().size() == 2);

        std::cout << "  Handshake and wire format test passed" << std::endl;
    }

    // Test 2: Never connected
    {
        std::cout << "Test 2: Disconnected link" << std::endl;

        TestRig::SimRig rig(SimSerialDevice::Options{}, false);
        assert(rig.link->state() == LinkState::Disconnected);

        for (int angle : {0, 45, 90, 135, 180}) {
            for (const char* name : {"pan", "left_arm", "right_arm"}) {
                auto r = rig.link->send(name, angle);
                assert(!r.success);
                assert(r.error == LinkError::NOT_CONNECTED);
            }
        }
        assert(rig.device->wire().empty());
        assert(rig.link->get_statistics().not_connected == 15);
        assert(!rig.link->last_angle(Servo::Pan).has_value());
        assert(rig.link->assumed_angle(Servo::Pan) == 90);

        std::cout << "  Disconnected link test passed" << std::endl;
    }

    // Test 3: Non-existent port, real and simulated
    {
        std::cout << "Test 3: Non-existent port" << std::endl;

        ActuatorLink link(std::make_unique<PosixSerialPort>());
        link.set_diagnostic_sink([](Severity, const std::string&) {});
        LinkError rc = link.connect("/dev/does-not-exist-rufus", 9600, std::chrono::milliseconds(10));
        assert(rc == LinkError::PORT_OPEN_FAILED);
        assert(link.state() == LinkState::Disconnected);

        auto r = link.send("pan", 90);
        assert(!r.success);
        assert(r.error == LinkError::NOT_CONNECTED);

        SimSerialDevice::Options opts;
        opts.fail_open = true;
        TestRig::SimRig rig(opts, false);
        assert(rig.link->connect("/dev/sim0", 9600) == LinkError::PORT_OPEN_FAILED);
        assert(rig.logged("not connected"));
        assert(!rig.link->send("pan", 90).success);
        assert(rig.device->wire().empty());

        assert(rig.link->connect("/dev/sim0", 12345) == LinkError::INVALID_BAUD);

        std::cout << "  Non-existent port test passed" << std::endl;
    }

    // Test 4: Unknown names and range checks do no I/O
    {
        std::cout << "Test 4: Unknown names and out-of-range angles" << std::endl;

        TestRig::SimRig rig;

        for (const char* name : {"tail", "", "PAN", "left-arm", "wave"}) {
            auto r = rig.link->send(name, 90);
            assert(!r.success);
            assert(r.error == LinkError::UNKNOWN_ACTUATOR);
        }
        auto r = rig.link->send(7, 90);
        assert(r.error == LinkError::UNKNOWN_ACTUATOR);

        r = rig.link->send("pan", 181);
        assert(r.error == LinkError::OUT_OF_RANGE);
        r = rig.link->send("pan", -1);
        assert(r.error == LinkError::OUT_OF_RANGE);

        assert(rig.device->wire().empty());
        auto stats = rig.link->get_statistics();
        assert(stats.unknown_actuators == 6);
        assert(stats.range_violations == 2);

        // Bounds themselves are accepted
        assert(rig.link->send("pan", 0).success);
        assert(rig.link->send("pan", 180).success);

        std::cout << "  Unknown names and range test passed" << std::endl;
    }

    // Test 5: Acknowledgment discipline
    {
        std::cout << "Test 5: Acknowledgment failures" << std::endl;

        TestRig::SimRig rig;

        rig.device->set_ack_mode(SimSerialDevice::AckMode::ERROR);
        auto r = rig.link->send("right_arm", 60);
        assert(!r.success);
        assert(r.error == LinkError::NACK);
        assert(r.reply == "ERR");
        assert(!rig.link->last_angle(Servo::RightArm).has_value());

        rig.device->set_ack_mode(SimSerialDevice::AckMode::SILENT);
        auto start = std::chrono::steady_clock::now();
        r = rig.link->send("right_arm", 60);
        auto elapsed = std::chrono::steady_clock::now() - start;
        assert(r.error == LinkError::ACK_TIMEOUT);
        assert(elapsed < std::chrono::seconds(1));

        // The link stays usable after acknowledgment failures
        assert(rig.link->state() == LinkState::Ready);
        rig.device->set_ack_mode(SimSerialDevice::AckMode::OK);
        assert(rig.link->send("right_arm", 60).success);

        // A late reply from an earlier command is not taken as the next ack
        rig.device->inject_line("ERR:LATE");
        assert(rig.link->send("right_arm", 70).success);

        auto stats = rig.link->get_statistics();
        assert(stats.ack_failures == 2);
        assert(rig.device->wire() == "5:60\n5:60\n5:60\n5:70\n");

        std::cout << "  Acknowledgment failures test passed" << std::endl;
    }

    // Test 6: No READY line still yields a usable link
    {
        std::cout << "Test 6: Missing handshake" << std::endl;

        SimSerialDevice::Options opts;
        opts.announce_ready = false;
        opts.boot_banner = {"booting servo shield"};
        TestRig::SimRig rig(opts);

        assert(rig.link->state() == LinkState::Ready);
        assert(!rig.link->handshake_received());
        assert(rig.logged("no READY"));
        assert(rig.link->send("pan", 90).success);

        // READY after a banner line is still recognized
        SimSerialDevice::Options noisy;
        noisy.boot_banner = {"Servo controller v2", ""};
        TestRig::SimRig rig2(noisy);
        assert(rig2.link->handshake_received());

        std::cout << "  Missing handshake test passed" << std::endl;
    }

    // Test 7: Write failure disconnects, no auto-reconnect
    {
        std::cout << "Test 7: I/O error handling" << std::endl;

        SimSerialDevice::Options opts;
        opts.fail_write_after = 2;
        TestRig::SimRig rig(opts);

        assert(rig.link->send("pan", 80).success);
        assert(rig.link->send("pan", 85).success);

        auto r = rig.link->send("pan", 95);
        assert(!r.success);
        assert(r.error == LinkError::WRITE_FAILURE);
        assert(rig.link->state() == LinkState::Disconnected);
        assert(rig.logged("servo command failed"));

        r = rig.link->send("pan", 95);
        assert(r.error == LinkError::NOT_CONNECTED);
        assert(rig.link->get_statistics().write_failures == 1);
        assert(rig.link->last_angle(Servo::Pan).value() == 85);

        std::cout << "  I/O error handling test passed" << std::endl;
    }

    // Test 8: close() and reconnect
    {
        std::cout << "Test 8: close and reconnect" << std::endl;

        TestRig::SimRig rig;
        rig.link->close();
        rig.link->close();
        assert(rig.link->state() == LinkState::Disconnected);
        assert(!rig.device->is_open());
        assert(rig.link->send("pan", 90).error == LinkError::NOT_CONNECTED);

        assert(rig.link->connect("/dev/sim0", 9600) == LinkError::OK);
        assert(rig.device->open_count() == 2);
        assert(rig.link->send("pan", 90).success);

        // Connecting an already-open link reopens it
        assert(rig.link->connect("/dev/sim0", 115200) == LinkError::OK);
        assert(rig.device->open_count() == 3);
        assert(rig.link->port_path() == "/dev/sim0");

        std::cout << "  close and reconnect test passed" << std::endl;
    }

    // Test 9: Concurrent senders
    {
        std::cout << "Test 9: Concurrent senders" << std::endl;

        TestRig::SimRig rig;
        const int per_thread = 50;
        std::vector<std::thread> threads;
        for (const char* name : {"pan", "left_arm", "right_arm"}) {
            threads.emplace_back([&rig, name]() {
                for (int i = 0; i < per_thread; ++i) {
                    assert(rig.link->send(name, 30 + i).success);
                }
            });
        }
        for (auto& t : threads) t.join();

        auto lines = rig.device->lines();
        assert(lines.size() == 3 * per_thread);
        for (const auto& l : lines) {
            auto colon = l.find(':');
            assert(colon != std::string::npos);
            int ch = std::stoi(l.substr(0, colon));
            assert(ch == 2 || ch == 4 || ch == 5);
        }
        assert(rig.link->get_statistics().successful_commands == 3 * per_thread);

        std::cout << "  Concurrent senders test passed" << std::endl;
    }

    std::cout << "✅ All ActuatorLink tests passed!" << std::endl;
    return 0;
}
