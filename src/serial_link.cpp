// ============================================================================
// serial_link.cpp — implementation for transport/serial_link.hpp
// For the framing and retry rules see at_transport.hpp.
// ============================================================================

/**
 * @file serial_link.cpp
 */

#include "linkstation/transport/serial_link.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, O_NONBLOCK)
#include <unistd.h>        // ::read, ::write, ::close
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for bounded waits
#include <sys/ioctl.h>     // TIOCEXCL
#include <cerrno>
#include <cstring>         // strerror

namespace linkstation::transport {

// ---------------------------------------------------------------------------
// to_speed()
// ----------
// Map an integer baud to the termios constant. Unknown values fall back to
// 115200, which is what the modem's AT port runs at out of the box.
// ---------------------------------------------------------------------------
static speed_t to_speed(int baud) {
    switch (baud) {
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
#ifdef B230400
        case 230400: return B230400;
#endif
#ifdef B460800
        case 460800: return B460800;
#endif
#ifdef B921600
        case 921600: return B921600;
#endif
        default:     return B115200;
    }
}

// ---------------------------------------------------------------------------
// configure_port()
// ----------------
// AT port settings: 8 data bits, no parity, one stop bit, no hardware or
// software flow control, no line discipline processing in either direction.
// VMIN=VTIME=0 so read() never blocks; poll() does the waiting. tcsetattr()
// succeeds if any change was applied, so the result is read back and compared.
// On failure `step` names the call that failed and errno is left as it set it.
// ---------------------------------------------------------------------------
static bool configure_port(int fd, speed_t speed, const char*& step) {
    termios tio{};
    step = "tcgetattr";
    if (tcgetattr(fd, &tio) != 0) return false;

    tio.c_iflag &= ~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL | IXON | IXOFF | IXANY);
    tio.c_oflag &= ~OPOST;
    tio.c_lflag &= ~(ECHO | ECHONL | ICANON | ISIG | IEXTEN);
    tio.c_cflag &= ~(CSIZE | PARENB | CSTOPB | CRTSCTS);
    tio.c_cflag |= CS8 | CLOCAL | CREAD;
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    step = "cfsetispeed";
    if (cfsetispeed(&tio, speed) != 0) return false;
    step = "cfsetospeed";
    if (cfsetospeed(&tio, speed) != 0) return false;

    step = "tcsetattr";
    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;

    termios applied{};
    step = "tcgetattr";
    if (tcgetattr(fd, &applied) != 0) return false;
    step = "verify";
    if (cfgetospeed(&applied) != speed || cfgetispeed(&applied) != speed ||
        (applied.c_cflag & CSIZE) != CS8 || (applied.c_cflag & (PARENB | CSTOPB | CRTSCTS)) != 0 ||
        (applied.c_lflag & (ICANON | ECHO)) != 0) {
        errno = EINVAL;
        return false;
    }

    step = "tcflush";
    return tcflush(fd, TCIOFLUSH) == 0;
}

bool SerialLink::open(const std::string& path, int baud, std::string& err) {
    close();
    int fd = ::open(path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        err = "open " + path + ": " + std::strerror(errno);
        return false;
    }
    const char* step = "";
    if (!configure_port(fd, to_speed(baud), step)) {
        err = "termios " + path + ": " + step + ": " + std::strerror(errno);
        ::close(fd);
        return false;
    }
    // Other openers (ModemManager) get EBUSY while the AT port is held.
    if (::ioctl(fd, TIOCEXCL) != 0)
        spdlog::debug("[serial] exclusive mode unavailable port={} reason={}", path, std::strerror(errno));

    fd_ = fd;
    spdlog::debug("[serial] opened port={} baud={}", path, baud);
    return true;
}

void SerialLink::close() {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

bool SerialLink::discard_input() {
    if (fd_ < 0) return false;
    return tcflush(fd_, TCIFLUSH) == 0;
}

// ---------------------------------------------------------------------------
// write_all()
// -----------
// Loop until every byte is accepted. EAGAIN waits on POLLOUT for a short
// while; anything else (EIO after a USB unplug, EBADF) is a hard failure.
// ---------------------------------------------------------------------------
bool SerialLink::write_all(const std::string& data) {
    if (fd_ < 0) return false;
    std::size_t off = 0;
    while (off < data.size()) {
        ssize_t w = ::write(fd_, data.data() + off, data.size() - off);
        if (w > 0) { off += static_cast<std::size_t>(w); continue; }
        if (w < 0 && errno == EINTR) continue;
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{fd_, POLLOUT, 0};
            int pr = ::poll(&pfd, 1, 200);
            if (pr <= 0 || (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))) return false;
            continue;
        }
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// read_some()
// -----------
// Wait up to `wait` for the fd to become readable, then drain what is there.
// POLLHUP/POLLERR, or a zero-length read on a readable fd, means the device
// went away (ttyUSB nodes vanish when the modem re-enumerates).
// ---------------------------------------------------------------------------
ReadResult SerialLink::read_some(std::string& out, std::chrono::milliseconds wait) {
    if (fd_ < 0) return ReadResult::Error;
    pollfd pfd{fd_, POLLIN, 0};
    int timeout_ms = wait.count() < 0 ? 0 : static_cast<int>(wait.count());

    int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr == 0) return ReadResult::Idle;
    if (pr < 0)  return errno == EINTR ? ReadResult::Idle : ReadResult::Error;
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return ReadResult::Error;

    char buf[512];
    bool got = false;
    for (;;) {
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n > 0) { out.append(buf, static_cast<std::size_t>(n)); got = true; continue; }
        if (n == 0) return got ? ReadResult::Data : ReadResult::Error;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) break;
        return ReadResult::Error;
    }
    return got ? ReadResult::Data : ReadResult::Idle;
}

} // namespace linkstation::transport
