/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "weighlink/transport/serial/boost_serial_port.hpp"

#if defined(WEIGHLINK_PLATFORM_POSIX)
#include <sys/ioctl.h>
#include <termios.h>

#include <cerrno>
#endif

namespace weighlink {
namespace transport {

#if defined(WEIGHLINK_PLATFORM_POSIX)

namespace {

boost::system::error_code last_error() { return boost::system::error_code(errno, boost::system::system_category()); }

void set_bit(tcflag_t& flags, tcflag_t bit, bool on) {
  if (on) {
    flags |= bit;
  } else {
    flags &= ~bit;
  }
}

}  // namespace

void BoostSerialPort::set_flow_control(const config::FlowControl& flow, boost::system::error_code& ec) {
  ec.clear();
  if (!port_.is_open()) {
    ec = net::error::bad_descriptor;
    return;
  }

  int fd = port_.native_handle();
  termios tio{};
  if (::tcgetattr(fd, &tio) != 0) {
    ec = last_error();
    return;
  }

#ifdef CRTSCTS
  set_bit(tio.c_cflag, CRTSCTS, flow.rtscts);
#else
  if (flow.rtscts) {
    ec = net::error::operation_not_supported;
    return;
  }
#endif
  set_bit(tio.c_iflag, IXON, flow.xon);
  set_bit(tio.c_iflag, IXOFF, flow.xoff);
  set_bit(tio.c_iflag, IXANY, flow.xany);
  set_bit(tio.c_cflag, HUPCL, flow.hupcl);

  if (::tcsetattr(fd, TCSANOW, &tio) != 0) {
    ec = last_error();
  }
}

void BoostSerialPort::set_modem_signals(const config::ModemSignals& signals, boost::system::error_code& ec) {
  ec.clear();
  if (!port_.is_open()) {
    ec = net::error::bad_descriptor;
    return;
  }

  int fd = port_.native_handle();
  int status = 0;
  if (::ioctl(fd, TIOCMGET, &status) != 0) {
    ec = last_error();
    return;
  }

  // One TIOCMSET so DTR and RTS change together
  status = signals.dtr ? (status | TIOCM_DTR) : (status & ~TIOCM_DTR);
  status = signals.rts ? (status | TIOCM_RTS) : (status & ~TIOCM_RTS);
  if (::ioctl(fd, TIOCMSET, &status) != 0) {
    ec = last_error();
    return;
  }

  if (::ioctl(fd, TIOCCBRK) != 0) {
    ec = last_error();
  }
}

#elif defined(WEIGHLINK_PLATFORM_WINDOWS)

namespace {

boost::system::error_code last_error() {
  return boost::system::error_code(static_cast<int>(::GetLastError()), boost::system::system_category());
}

}  // namespace

void BoostSerialPort::set_flow_control(const config::FlowControl& flow, boost::system::error_code& ec) {
  ec.clear();
  if (!port_.is_open()) {
    ec = net::error::bad_descriptor;
    return;
  }

  HANDLE handle = port_.native_handle();
  DCB dcb;
  ::SecureZeroMemory(&dcb, sizeof(dcb));
  dcb.DCBlength = sizeof(dcb);
  if (!::GetCommState(handle, &dcb)) {
    ec = last_error();
    return;
  }

  dcb.fOutxCtsFlow = flow.rtscts ? TRUE : FALSE;
  if (flow.rtscts) {
    dcb.fRtsControl = RTS_CONTROL_HANDSHAKE;
  } else if (dcb.fRtsControl == RTS_CONTROL_HANDSHAKE) {
    dcb.fRtsControl = RTS_CONTROL_DISABLE;
  }
  dcb.fOutX = flow.xon ? TRUE : FALSE;
  dcb.fInX = flow.xoff ? TRUE : FALSE;
  dcb.fTXContinueOnXoff = flow.xany ? TRUE : FALSE;
  dcb.fOutxDsrFlow = FALSE;
  dcb.fDsrSensitivity = FALSE;

  if (!::SetCommState(handle, &dcb)) {
    ec = last_error();
  }
}

void BoostSerialPort::set_modem_signals(const config::ModemSignals& signals, boost::system::error_code& ec) {
  ec.clear();
  if (!port_.is_open()) {
    ec = net::error::bad_descriptor;
    return;
  }

  HANDLE handle = port_.native_handle();
  DCB dcb;
  ::SecureZeroMemory(&dcb, sizeof(dcb));
  dcb.DCBlength = sizeof(dcb);
  if (!::GetCommState(handle, &dcb)) {
    ec = last_error();
    return;
  }

  // DCB carries both line levels, so a single SetCommState applies them together
  dcb.fDtrControl = signals.dtr ? DTR_CONTROL_ENABLE : DTR_CONTROL_DISABLE;
  if (dcb.fRtsControl != RTS_CONTROL_HANDSHAKE) {
    dcb.fRtsControl = signals.rts ? RTS_CONTROL_ENABLE : RTS_CONTROL_DISABLE;
  }
  if (!::SetCommState(handle, &dcb)) {
    ec = last_error();
    return;
  }

  if (!::EscapeCommFunction(handle, CLRBREAK)) {
    ec = last_error();
  }
}

#endif

}  // namespace transport
}  // namespace weighlink
