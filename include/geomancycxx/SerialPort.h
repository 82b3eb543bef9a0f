// Copyright 2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Line-oriented serial port for NMEA receivers (POSIX termios).

#pragma once

#include "LineSource.h"
#include "Numerology.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace geomancy
{

class SerialPort
{
public:
    // Poll in short slices so a cleared running flag is seen promptly.
    static constexpr int POLL_SLICE_MS = 100;

    SerialPort() = default;
    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    ~SerialPort()
    {
        close();
    }

    static bool baud_to_speed(int baud, speed_t& speed)
    {
        switch (baud)
        {
        case 4800:   speed = B4800; return true;
        case 9600:   speed = B9600; return true;
        case 19200:  speed = B19200; return true;
        case 38400:  speed = B38400; return true;
        case 57600:  speed = B57600; return true;
        case 115200: speed = B115200; return true;
        case 230400: speed = B230400; return true;
        default:     return false;
        }
    }

    /**
     * Open the device raw 8N1 at the given rate.
     * On failure last_error() describes the cause.
     */
    bool open(const std::string& device, int baud, int timeout_ms = read_timeout_ms)
    {
        close();

        speed_t speed;
        if (!baud_to_speed(baud, speed))
        {
            error_ = "unsupported baud rate " + std::to_string(baud);
            return false;
        }

        int fd = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
        if (fd < 0)
        {
            error_ = device + ": " + std::strerror(errno);
            return false;
        }

        termios tty{};
        if (tcgetattr(fd, &tty) != 0)
        {
            error_ = "tcgetattr failed: " + std::string(std::strerror(errno));
            ::close(fd);
            return false;
        }

        cfmakeraw(&tty);
        cfsetispeed(&tty, speed);
        cfsetospeed(&tty, speed);
        tty.c_cflag = (tty.c_cflag & ~CSIZE) | CS8;
        tty.c_cflag &= ~(PARENB | CSTOPB | CRTSCTS);
        tty.c_cflag |= CLOCAL | CREAD;
        tty.c_cc[VMIN] = 0;
        tty.c_cc[VTIME] = 0;

        if (tcsetattr(fd, TCSANOW, &tty) != 0)
        {
            error_ = "tcsetattr failed: " + std::string(std::strerror(errno));
            ::close(fd);
            return false;
        }

        tcflush(fd, TCIFLUSH);

        fd_ = fd;
        timeout_ms_ = timeout_ms;
        buffer_.clear();
        return true;
    }

    void close()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
        buffer_.clear();
    }

    bool is_open() const { return fd_ >= 0; }

    const std::string& last_error() const { return error_; }

    /**
     * Read one line including its terminator.
     *
     * Blocks until a full line arrives, the read timeout expires or
     * running is cleared. Bytes received after the line stay buffered
     * for the next call.
     */
    ReadResult read_line(std::string& line, const std::atomic<bool>& running)
    {
        if (fd_ < 0)
        {
            error_ = "port not open";
            return ReadResult::ERROR;
        }

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);

        for (;;)
        {
            auto newline = buffer_.find('\n');
            if (newline != std::string::npos)
            {
                line = buffer_.substr(0, newline + 1);
                buffer_.erase(0, newline + 1);
                return ReadResult::OK;
            }

            // Noise without a line feed never becomes a sentence.
            if (buffer_.size() > nmea_max_line_chars) buffer_.clear();

            if (!running) return ReadResult::CANCELLED;

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) return ReadResult::TIMEOUT;

            pollfd pfd{fd_, POLLIN, 0};
            int rc = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining, POLL_SLICE_MS)));
            if (rc < 0)
            {
                if (errno == EINTR) continue;
                error_ = "poll failed: " + std::string(std::strerror(errno));
                return ReadResult::ERROR;
            }
            if (rc == 0) continue;

            if (!(pfd.revents & POLLIN))
            {
                error_ = "device disconnected";
                return ReadResult::ERROR;
            }

            char chunk[128];
            ssize_t count = ::read(fd_, chunk, sizeof(chunk));
            if (count < 0)
            {
                if (errno == EINTR || errno == EAGAIN) continue;
                error_ = "read failed: " + std::string(std::strerror(errno));
                return ReadResult::ERROR;
            }
            if (count == 0)
            {
                error_ = "device closed";
                return ReadResult::ERROR;
            }
            buffer_.append(chunk, static_cast<size_t>(count));
        }
    }

    /// Adapt to the pipeline's reader type; the port must outlive it.
    line_reader_t reader(const std::atomic<bool>& running)
    {
        return [this, &running](std::string& line) { return read_line(line, running); };
    }

private:
    int fd_ = -1;
    int timeout_ms_ = read_timeout_ms;
    std::string buffer_;
    std::string error_;
};

} // namespace geomancy
