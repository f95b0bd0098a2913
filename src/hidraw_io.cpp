// ============================================================================
// hidraw_io.cpp — implementation for hidraw_io.hpp
// For API/overview see the matching .hpp. For usage, see cli/main.cpp.
// ============================================================================

/**
 * @file hidraw_io.cpp
 */

#include "hidraw_io.hpp"

#include <fcntl.h>          // ::open flags
#include <unistd.h>         // ::read, ::write, ::close
#include <poll.h>           // poll(2) for timeout-based reads
#include <sys/ioctl.h>      // ioctl
#include <linux/hidraw.h>   // HIDIOCGRAWINFO, HIDIOCGRAWNAME
#include <cerrno>
#include <cstring>

namespace hf2 {

// hidraw write prefix: unnumbered reports still take a 0 report number
static constexpr uint8_t REPORT_NUMBER = 0x00;
static constexpr size_t  MAX_REPORT    = 64;


// ---------------------------------------------------------------------------
// open_hidraw()
// -------------
// O_NONBLOCK so read_report() can poll without stalling the driver loop.
// ---------------------------------------------------------------------------
int open_hidraw(const std::string& dev) {
    int fd = ::open(dev.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) return -1;                        // missing node or no permission
    return fd;
}


// ---------------------------------------------------------------------------
// write_report()
// --------------
// Prepend the report number and write the report in one syscall; hidraw
// treats each write() as exactly one report.
// ---------------------------------------------------------------------------
bool write_report(int fd, const uint8_t* report, size_t len) {
    if (fd < 0 || !report || len == 0 || len > MAX_REPORT) return false;

    uint8_t buf[MAX_REPORT + 1];
    buf[0] = REPORT_NUMBER;
    std::memcpy(buf + 1, report, len);

    ssize_t w;
    do {
        w = ::write(fd, buf, len + 1);
    } while (w < 0 && errno == EINTR);

    return w == static_cast<ssize_t>(len + 1);
}


// ---------------------------------------------------------------------------
// read_report()
// -------------
// One read() on hidraw returns one whole report. poll() supplies the timeout.
// ---------------------------------------------------------------------------
int read_report(int fd, uint8_t* out, size_t cap, int timeout_ms) {
    if (fd < 0 || !out || cap == 0) return -1;

    pollfd pfd{fd, POLLIN, 0};
    int pr;
    do {
        pr = ::poll(&pfd, 1, timeout_ms);
    } while (pr < 0 && errno == EINTR);

    if (pr == 0) return 0;                                     // timeout
    if (pr < 0) return -1;                                     // poll error
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return -1; // unplugged

    ssize_t n = ::read(fd, out, cap);
    if (n > 0) return static_cast<int>(n);
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return 0;
    return -1;
}


// ---------------------------------------------------------------------------
// read_hidraw_info()
// ------------------
// Identify the node for logs. Not used for discovery.
// ---------------------------------------------------------------------------
bool read_hidraw_info(int fd, HidrawInfo& out) {
    if (fd < 0) return false;

    hidraw_devinfo info{};
    if (::ioctl(fd, HIDIOCGRAWINFO, &info) < 0) return false;
    out.vendor  = static_cast<uint16_t>(info.vendor);
    out.product = static_cast<uint16_t>(info.product);
    out.bustype = info.bustype;

    char name[256] = {0};
    if (::ioctl(fd, HIDIOCGRAWNAME(sizeof(name)), name) < 0) return false;
    name[sizeof(name) - 1] = '\0';
    out.name = name;
    return true;
}


// ---------------------------------------------------------------------------
// close_hidraw()
// ---------------------------------------------------------------------------
void close_hidraw(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace hf2
