/**
 * @file hidraw_io.hpp
 * @brief Public API for talking to an hf2 device through a Linux /dev/hidraw node.
 *
 * @details
 * PURPOSE
 * -------
 * The minimal surface needed to move 64-byte HID reports between a Linux host
 * and an hf2 device. Pairs with hidraw_io.cpp for the POSIX work and with
 * hf2::transport::LinuxHidraw, which wraps these calls as an ITransport.
 *
 * - hf2::open_hidraw: open the node read/write, non-blocking.
 * - hf2::write_report: send one report, prefixing the report number hidraw expects.
 * - hf2::read_report: wait up to a timeout for one input report.
 * - hf2::read_hidraw_info: vendor/product/name of the opened node, for logs.
 * - hf2::close_hidraw: close the descriptor.
 *
 * DESIGN CHOICES
 * --------------
 * - Free functions over a plain fd, no class hierarchy, no hidden threads.
 * - Device discovery is not done here. Callers pass the node path; udev rules
 *   (or `ls /sys/class/hidraw`) tell you which one.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Permissions: hidraw nodes are root-only by default. Add a udev rule granting
 *   your user access for the board's VID:PID.
 * - hf2 devices use unnumbered reports. hidraw still wants a leading report
 *   number byte (0) on write; reads come back without it.
 *
 * EXAMPLE
 * -------
 * @code
 *   int fd = hf2::open_hidraw("/dev/hidraw3");
 *   if (fd < 0) { // handle open failure }
 *   uint8_t report[64] = {0x40};
 *   hf2::write_report(fd, report, sizeof(report));
 *   uint8_t in[64];
 *   int n = hf2::read_report(fd, in, sizeof(in), 500);   // >0 bytes, 0 timeout, -1 error
 *   hf2::close_hidraw(fd);
 * @endcode
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace hf2 {

struct HidrawInfo {
  uint16_t    vendor{0};
  uint16_t    product{0};
  uint32_t    bustype{0};
  std::string name;
};

/**
 * @brief Open a hidraw node for report I/O.
 * @return file descriptor (>=0) or -1 on failure (errno preserved).
 */
int open_hidraw(const std::string& dev);

/**
 * @brief Write one output report.
 *
 * @param report  Report bytes without the report number.
 * @param len     Report length (normally 64).
 * @return true if the whole report (plus the report-number byte) was written.
 */
bool write_report(int fd, const uint8_t* report, size_t len);

/**
 * @brief Wait for and read one input report.
 *
 * @return bytes read (>0), 0 on timeout or when nothing is pending with
 *         timeout_ms == 0, -1 on I/O error.
 */
int read_report(int fd, uint8_t* out, size_t cap, int timeout_ms);

/// Query vendor/product/bus and the device name. False if the ioctls fail.
bool read_hidraw_info(int fd, HidrawInfo& out);

/// Close a descriptor from open_hidraw(); negative values are ignored.
void close_hidraw(int fd);

} // namespace hf2
