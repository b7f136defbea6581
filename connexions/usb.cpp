//  usb.cpp -- shuttle messages between software and USB printer
//  Copyright (C) 2012-2015  SEIKO EPSON CORPORATION
//  Copyright (C) 2011, 2015  Olaf Meeuwissen
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

#include <cstdlib>
#include <stdexcept>

#include <boost/throw_exception.hpp>

#include <insatsu/log.hpp>

#include "usb.hpp"

namespace insatsu {
namespace _cnx_ {

connexion::ptr
make_usb (const std::string& path)
{
  uint16_t vid;
  uint16_t pid;

  parse_usb_path (path, vid, pid);

#if HAVE_LIBUSB
  return make_shared< usb > (vid, pid);
#else
  log::alert ("USB support disabled at compile time");
  return connexion::ptr ();
#endif
}

using std::runtime_error;

void
parse_usb_path (const std::string& path,
                uint16_t& vendor_id, uint16_t& product_id)
{
  std::string::size_type colon = path.find (':');

  if (std::string::npos == colon
      || 0 == colon || path.size () - 1 == colon)
    BOOST_THROW_EXCEPTION
      (std::invalid_argument ("USB path not of the form VID:PID: '"
                              + path + "'"));

  std::string vid (path.substr (0, colon));
  std::string pid (path.substr (colon + 1));
  char *end_v = 0;
  char *end_p = 0;

  unsigned long v = strtoul (vid.c_str (), &end_v, 16);
  unsigned long p = strtoul (pid.c_str (), &end_p, 16);

  if (*end_v || *end_p || 0xffff < v || 0xffff < p)
    BOOST_THROW_EXCEPTION
      (std::invalid_argument ("invalid USB vendor or product id: '"
                              + path + "'"));

  vendor_id  = v;
  product_id = p;
}

usb_device::usb_device ()
  : vendor_id (0), product_id (0), bus (-1), address (-1)
{}

#if HAVE_LIBUSB

  const int milliseconds =    1;

  bool usb::is_initialised_  = false;
  int  usb::default_timeout_ = 400 * milliseconds;
  libusb_context *usb::ctx_  = 0;
  int usb::connexion_count_  = 0;

namespace {

  std::string
  descriptor_string (libusb_device_handle *handle, uint8_t index)
  {
    if (!index) return std::string ();

    unsigned char buf[256];
    int n = libusb_get_string_descriptor_ascii (handle, index,
                                                buf, sizeof (buf));
    if (0 > n)
      {
        log::debug (log::CONNEXION, "string descriptor %1%: %2%")
          % int (index)
          % libusb_error_name (n);
        return std::string ();
      }
    return std::string (reinterpret_cast< char * > (buf), n);
  }

  void
  describe (usb_device& info, libusb_device *dev,
            libusb_device_handle *handle,
            const struct libusb_device_descriptor& descriptor)
  {
    info.vendor_id  = descriptor.idVendor;
    info.product_id = descriptor.idProduct;
    info.bus        = libusb_get_bus_number (dev);
    info.address    = libusb_get_device_address (dev);

    if (handle)
      {
        info.manufacturer = descriptor_string (handle,
                                               descriptor.iManufacturer);
        info.product      = descriptor_string (handle,
                                               descriptor.iProduct);
      }
  }

}       // namespace

  usb::usb (uint16_t vendor_id, uint16_t product_id)
    : handle_(0), if_(-1), ep_bulk_i_(-1), ep_bulk_o_(-1)
    , reattach_(false)
  {
    if (!is_initialised_)
      {
        int err = libusb_init (&ctx_);
        is_initialised_ = !err;

        if (err)
          {
            ctx_ = 0;
            log::error (libusb_error_name (err));
            BOOST_THROW_EXCEPTION
              (runtime_error ("unable to initialise USB support"));
          }
      }

    libusb_device **haystack;
    ssize_t cnt = libusb_get_device_list (ctx_, &haystack);

    for (ssize_t i = 0; !handle_ && i < cnt; i++)
      {
        handle_ = usable_match_(vendor_id, product_id, haystack[i]);
      }

    libusb_free_device_list (haystack, 1);

    if (!handle_)
      {
        if (0 == connexion_count_)
          {
            libusb_exit (ctx_);
            ctx_ = 0;
            is_initialised_ = false;
          }
        BOOST_THROW_EXCEPTION
          (runtime_error ("no usable, matching device"));
      }

    ++connexion_count_;
  }

  usb::~usb (void)
  {
    libusb_release_interface (handle_, if_);
    if (reattach_)
      libusb_attach_kernel_driver (handle_, if_);
    libusb_close (handle_);

    if (0 == --connexion_count_)
      {
        libusb_exit (ctx_);
        ctx_ = 0;
        is_initialised_ = false;
      }
  }

  streamsize
  usb::send (const octet *message, streamsize size)
  {
    return send (message, size, 0.001 * default_timeout_);
  }

  streamsize
  usb::send (const octet *message, streamsize size, double timeout)
  {
    unsigned char *buf = reinterpret_cast<unsigned char *>
      (const_cast<octet *> (message));

    return transfer_(ep_bulk_o_, buf, size, timeout);
  }

  streamsize
  usb::recv (octet *message, streamsize size)
  {
    return recv (message, size, 0.001 * default_timeout_);
  }

  streamsize
  usb::recv (octet *message, streamsize size, double timeout)
  {
    unsigned char *buf = reinterpret_cast<unsigned char *> (message);

    return transfer_(ep_bulk_i_, buf, size, timeout);
  }

  const usb_device&
  usb::info () const
  {
    return info_;
  }

  //  A timeout is not an error here.  The caller gets to decide what
  //  to make of the octets that did get transferred.
  streamsize
  usb::transfer_(int endpoint, unsigned char *buf, streamsize size,
                 double timeout)
  {
    int transferred = 0;
    int err = libusb_bulk_transfer (handle_, endpoint, buf, size,
                                    &transferred, 1000 * timeout);

    if (LIBUSB_ERROR_PIPE == err)
      err = libusb_clear_halt (handle_, endpoint);

    if (LIBUSB_ERROR_TIMEOUT == err)
      {
        log::debug (log::CONNEXION, "endpoint %1$#04x: timed out after"
                    " %2% of %3% octets")
          % endpoint
          % transferred
          % size;
        return transferred;
      }

    if (err)
      {
        log::error (libusb_error_name (err));
        BOOST_THROW_EXCEPTION
          (runtime_error (libusb_error_name (err)));
      }
    return transferred;
  }

  libusb_device_handle *
  usb::usable_match_(uint16_t vendor_id, uint16_t product_id,
                     libusb_device *dev)
  {
    struct libusb_device_descriptor descriptor;

    int err = libusb_get_device_descriptor (dev, &descriptor);

    if (err
        || vendor_id  != descriptor.idVendor
        || product_id != descriptor.idProduct)
      return NULL;

    err = libusb_open (dev, &handle_);
    if (err)
      {
        log::error ("%1%: open: %2%")
          % __func__
          % libusb_error_name (err);
        return NULL;
      }

    if_ = 0;
    if (1 == libusb_kernel_driver_active (handle_, if_))
      {
        err = libusb_detach_kernel_driver (handle_, if_);
        if (err)
          {
            log::error ("%1%: detach kernel driver: %2%")
              % __func__
              % libusb_error_name (err);

            libusb_close (handle_);
            handle_ = NULL;
            return NULL;
          }
        reattach_ = true;
      }

    err = libusb_claim_interface (handle_, if_);
    if (err)
      {
        log::error ("%1%: claim interface: %2%")
          %  __func__
          % libusb_error_name (err);

        if (reattach_)
          libusb_attach_kernel_driver (handle_, if_);
        reattach_ = false;
        if_ = -1;
        libusb_close (handle_);
        handle_ = NULL;
        return NULL;
      }

    if (set_bulk_endpoints_(dev))
      {
        describe (info_, dev, handle_, descriptor);
        log::brief (log::CONNEXION, "claimed %1$04x:%2$04x (%3% %4%)")
          % info_.vendor_id
          % info_.product_id
          % info_.manufacturer
          % info_.product;
        return handle_;         // we got a usable match!
      }

    log::error ("%1%: no bulk endpoint pair on interface %2%")
      % __func__
      % if_;

    libusb_release_interface (handle_, if_);
    if (reattach_)
      libusb_attach_kernel_driver (handle_, if_);
    reattach_ = false;
    if_ = -1;
    libusb_close (handle_);
    handle_ = NULL;
    return NULL;
  }

  bool
  usb::set_bulk_endpoints_(libusb_device *dev)
  {
    if (!dev) return false;

    struct libusb_config_descriptor *config;

    int err = libusb_get_active_config_descriptor (dev, &config);
    if (err)
      {
        return false;
      }

    for (int a = 0; a < config->interface[if_].num_altsetting; ++a)
      {
        const struct libusb_interface_descriptor *id
          = &config->interface[if_].altsetting[a];

        for (int n = 0; n < id->bNumEndpoints; ++n)
          {
            const struct libusb_endpoint_descriptor *ep = &id->endpoint[n];

            if (LIBUSB_TRANSFER_TYPE_BULK
                == (LIBUSB_TRANSFER_TYPE_MASK & ep->bmAttributes))
              {
                if (LIBUSB_ENDPOINT_DIR_MASK & ep->bEndpointAddress)
                  ep_bulk_i_ = ep->bEndpointAddress;
                else
                  ep_bulk_o_ = ep->bEndpointAddress;
              }
          }
      }
    libusb_free_config_descriptor (config);

    return (-1 != ep_bulk_i_ && -1 != ep_bulk_o_);
  }

  std::vector< usb_device >
  usb_device::enumerate ()
  {
    std::vector< usb_device > rv;
    libusb_context *ctx = 0;

    int err = libusb_init (&ctx);
    if (err)
      {
        log::error (libusb_error_name (err));
        BOOST_THROW_EXCEPTION
          (runtime_error ("unable to initialise USB support"));
      }

    libusb_device **haystack;
    ssize_t cnt = libusb_get_device_list (ctx, &haystack);

    for (ssize_t i = 0; i < cnt; i++)
      {
        struct libusb_device_descriptor descriptor;

        if (libusb_get_device_descriptor (haystack[i], &descriptor))
          continue;

        libusb_device_handle *handle = 0;
        err = libusb_open (haystack[i], &handle);
        if (err)
          {
            log::trace (log::CONNEXION, "%1%: open: %2%")
              % __func__
              % libusb_error_name (err);
            handle = 0;
          }

        usb_device info;
        describe (info, haystack[i], handle, descriptor);
        rv.push_back (info);

        if (handle) libusb_close (handle);
      }

    libusb_free_device_list (haystack, 1);
    libusb_exit (ctx);

    return rv;
  }

#else   /* !HAVE_LIBUSB */

  std::vector< usb_device >
  usb_device::enumerate ()
  {
    log::alert ("USB support disabled at compile time");
    return std::vector< usb_device > ();
  }

#endif  /* HAVE_LIBUSB */

} // namespace _cnx_
} // namespace insatsu
