//  file.cpp -- printer device node connexion
//  Copyright (C) 2026  Insatsu contributors
//
//  License: GPL-3.0+
//
//  This file is part of the 'Insatsu' package.
//  This package is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License or, at
//  your option, any later version.
//
//    This program is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//  You ought to have received a copy of the GNU General Public License
//  along with this package.  If not, see <http://www.gnu.org/licenses/>.

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <boost/throw_exception.hpp>

#include <insatsu/log.hpp>

#include "file.hpp"

namespace insatsu {
namespace _cnx_ {

connexion::ptr
make_file (const std::string& path)
{
  return make_shared< file > (path);
}

using std::runtime_error;

double file::default_timeout_ = 0.4;

file::file (const std::string& path)
  : fd_(-1), path_(path)
{
  errno = 0;
  fd_ = ::open (path_.c_str (), O_RDWR | O_NOCTTY);
  if (0 > fd_)
    {
      std::string msg (strerror (errno));
      log::error ("%1%: %2%") % path_ % msg;
      BOOST_THROW_EXCEPTION (runtime_error (path_ + ": " + msg));
    }
  log::brief (log::CONNEXION, "opened %1%") % path_;
}

file::~file (void)
{
  if (0 <= fd_) ::close (fd_);
}

streamsize
file::send (const octet *message, streamsize size)
{
  return send (message, size, default_timeout_);
}

streamsize
file::send (const octet *message, streamsize size, double timeout)
{
  streamsize sent = 0;

  while (sent < size && wait_(POLLOUT, timeout))
    {
      errno = 0;
      ssize_t n = ::write (fd_, message + sent, size - sent);
      if (0 > n)
        {
          if (EINTR == errno || EAGAIN == errno) continue;

          std::string msg (strerror (errno));
          log::error ("%1%: write: %2%") % path_ % msg;
          BOOST_THROW_EXCEPTION (runtime_error (path_ + ": " + msg));
        }
      sent += n;
    }
  return sent;
}

streamsize
file::recv (octet *message, streamsize size)
{
  return recv (message, size, default_timeout_);
}

streamsize
file::recv (octet *message, streamsize size, double timeout)
{
  if (!wait_(POLLIN, timeout))
    return 0;

  ssize_t n;
  do
    {
      errno = 0;
      n = ::read (fd_, message, size);
    }
  while (0 > n && EINTR == errno);

  if (0 > n)
    {
      std::string msg (strerror (errno));
      log::error ("%1%: read: %2%") % path_ % msg;
      BOOST_THROW_EXCEPTION (runtime_error (path_ + ": " + msg));
    }
  return n;
}

//  Returns false when the timeout expired before the device became
//  ready for the requested \a events.
bool
file::wait_(short events, double timeout)
{
  struct pollfd pfd;
  pfd.fd      = fd_;
  pfd.events  = events;
  pfd.revents = 0;

  int rv;
  do
    {
      errno = 0;
      rv = ::poll (&pfd, 1, 1000 * timeout);
    }
  while (0 > rv && EINTR == errno);

  if (0 > rv)
    {
      std::string msg (strerror (errno));
      log::error ("%1%: poll: %2%") % path_ % msg;
      BOOST_THROW_EXCEPTION (runtime_error (path_ + ": " + msg));
    }
  if (0 == rv)
    {
      log::debug (log::CONNEXION, "%1%: timed out") % path_;
      return false;
    }
  if (pfd.revents & (POLLERR | POLLNVAL))
    {
      log::error ("%1%: device error") % path_;
      BOOST_THROW_EXCEPTION (runtime_error (path_ + ": device error"));
    }
  return true;
}

} // namespace _cnx_
} // namespace insatsu
