#pragma once
/**
 * @page orvibo-discovery Orvibo Discovery
 * @file discovery.hpp
 * @brief Find sockets and blasters on the LAN: broadcast "qa", collect replies, one record per MAC.
 *
 * @details
 * PURPOSE
 * -------
 * Every other operation needs a device's IP, MAC and kind. Discovery is how a
 * caller gets them: one broadcast, then listen for a fixed wall-clock window.
 * The number of devices is unknown in advance, so collection ends on time only,
 * never on a count.
 *
 * WHAT COUNTS AS A REPLY
 * ----------------------
 * A datagram becomes a DeviceRecord only when:
 *   - it decodes as a frame (magic and length check out),
 *   - its command is the discovery response ("qa"),
 *   - its model marker says socket ("SOC") or blaster ("IRD").
 * Anything else is noise from other broadcast traffic, our own request echoed
 * back by the kernel included, and is dropped with a debug line. A record is
 * never made up for an unknown marker.
 *
 * DEDUPLICATION
 * -------------
 * Devices often answer a broadcast more than once. The first reply per MAC
 * wins; later replies for the same MAC are ignored even if their IP differs.
 *
 * KNOWN FIRMWARE LIMIT
 * --------------------
 * A device serves one subscriber at a time. While some session holds a
 * subscription and a second one subscribes, the device stops answering
 * discovery until the first session closes or the device-side keep-alive
 * expires. A device missing from discover_all() may simply be busy.
 *
 * EXAMPLE
 * -------
 * @code
 *   orvibo::Config cfg;
 *   orvibo::DeviceMap found;
 *   if (orvibo::discover_all(cfg, found) == orvibo::Status::Ok) {
 *     for (const auto& kv : found) std::cout << orvibo::describe(kv.second) << "\n";
 *   }
 * @endcode
 */

#include "orvibo/config.hpp"
#include "orvibo/device.hpp"
#include "orvibo/status.hpp"
#include "orvibo/transport/transport_base.hpp"

#include <string>

namespace orvibo {

/**
 * @brief Broadcast discovery over @p t and collect replies for @p max_wait_ms.
 *
 * @p t is opened on cfg.bind_address:cfg.discovery_bind_port with broadcast
 * enabled if it is not open yet. Each receive waits at most @p timeout_ms.
 *
 * @param out  cleared, then filled IP -> record
 * @return Ok (possibly with an empty map), or the transport failure
 *         (BindError, SendError, ReceiveError).
 */
Status discover_all(transport::DatagramTransport& t, const Config& cfg,
                    int timeout_ms, int max_wait_ms, DeviceMap& out);

/**
 * @brief Send the discovery frame to @p target_ip only and wait for its reply.
 * @return Ok with @p out filled, DeviceNotFound when no valid reply from
 *         @p target_ip arrives in @p timeout_ms, or a transport failure.
 */
Status discover_one(transport::DatagramTransport& t, const Config& cfg,
                    const std::string& target_ip, int timeout_ms, DeviceRecord& out);

/// discover_all() on a fresh UdpTransport with the timeouts from @p cfg.
Status discover_all(const Config& cfg, DeviceMap& out);

/// discover_one() on a fresh UdpTransport with cfg.response_timeout_ms.
Status discover_one(const Config& cfg, const std::string& target_ip, DeviceRecord& out);

} // namespace orvibo
