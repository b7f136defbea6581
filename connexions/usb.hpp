//  usb.hpp -- shuttle messages between software and USB printer
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

#ifndef connexions_usb_hpp_
#define connexions_usb_hpp_

#if HAVE_LIBUSB
#include <libusb.h>
#endif

#include <string>
#include <vector>

#include <insatsu/connexion.hpp>
#include <insatsu/cstdint.hpp>

namespace insatsu {

namespace _cnx_ {

//! Opens the printer identified by a \c VID:PID \a path
/*! Returns a null pointer when USB support is not compiled in.
 */
connexion::ptr make_usb (const std::string& path);

//! Identifying information of an attached USB device
struct usb_device
{
  uint16_t vendor_id;
  uint16_t product_id;
  int bus;
  int address;
  std::string manufacturer;
  std::string product;

  usb_device ();

  //! Lists all USB devices currently attached to the system
  /*! Descriptor strings are empty for devices that cannot be opened
   *  with the current user's permissions.
   */
  static std::vector< usb_device > enumerate ();
};

//! Parses a \c VID:PID path into its hexadecimal components
/*! Throws a \c std::invalid_argument if \a path is malformed.
 */
void parse_usb_path (const std::string& path,
                     uint16_t& vendor_id, uint16_t& product_id);

#if HAVE_LIBUSB

  class usb : public connexion
  {
  public:
    usb (uint16_t vendor_id, uint16_t product_id);

    virtual ~usb (void);

    virtual streamsize send (const octet *message, streamsize size);
    virtual streamsize send (const octet *message, streamsize size,
                             double timeout);
    virtual streamsize recv (octet *message, streamsize size);
    virtual streamsize recv (octet *message, streamsize size,
                             double timeout);

    //! Identification of the claimed device
    const usb_device& info () const;

  private:
    libusb_device_handle * usable_match_(uint16_t vendor_id,
                                         uint16_t product_id,
                                         libusb_device *dev);
    bool set_bulk_endpoints_(libusb_device *dev);
    streamsize transfer_(int endpoint, unsigned char *buf,
                         streamsize size, double timeout);

    libusb_device_handle *handle_;
    int if_;
    int ep_bulk_i_;
    int ep_bulk_o_;
    bool reattach_;
    usb_device info_;

    static bool is_initialised_;
    static int  default_timeout_;

    static libusb_context *ctx_;
    static int connexion_count_;
  };

#endif  /* HAVE_LIBUSB */

} // namespace _cnx_
} // namespace insatsu

#endif  /* connexions_usb_hpp_ */
