//  dialect.hpp -- per printer model capabilities and command templates
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

#ifndef drivers_escpos_dialect_hpp_
#define drivers_escpos_dialect_hpp_

#include <map>
#include <set>
#include <string>

#include <insatsu/cstdint.hpp>
#include <insatsu/memory.hpp>

#include "buffer.hpp"

namespace insatsu {
namespace _drv_ {
namespace escpos {

//! Capabilities and command templates of a printer command dialect
/*! Receipt printers share the bulk of the ESC/POS command set but
 *  each vendor drops, adds or redefines a handful of commands.  All
 *  of that variation is captured here so that the rest of the driver
 *  never needs to ask which printer it is talking to.  It asks what
 *  the printer can do and which bytes to use instead.
 *
 *  Concrete dialects fill the feature set and the command template
 *  table when they are constructed and never change afterwards.  A
 *  new printer model is supported by adding one more subclass.
 */
class dialect
{
public:
  typedef shared_ptr< const dialect > ptr;

  typedef enum {
    SNBC,                       //!< SNBC class printers
    P3,                         //!< Custom SpA P3 class printers
    EPIC,                       //!< TransAct Epic class printers
    UNKNOWN,
  } model;

  typedef enum {
    STATUS_PUSH,                //!< automatic status back
    PERIPHERAL_SELECT,          //!< \c ESC \c = enable and disable
    FULL_CUT,
    PARTIAL_CUT,
    CODE128_BLOCK,              //!< length prefixed Code128 with code set
    COMPACT_BARCODE,            //!< fixed barcode header, NUL terminated
    SERIAL_NUMBER,
  } feature;

  typedef enum {
    SELECT_PRINTER,
    DESELECT_PRINTER,
    CUT_PAPER,
    CUT_PAPER_PARTIALLY,
    REQUEST_STATUS,
  } operation;

  //! How the printer's status is obtained and decoded
  typedef enum {
    STATUS_BLOCK,               //!< one fixed size status reply
    STATUS_POLLS,               //!< four single byte real-time polls
    STATUS_UNDECODED,           //!< request is sent, reply not decoded
  } status_protocol;

  virtual ~dialect () {}

  model id () const;
  const std::string& name () const;

  bool supports (feature f) const;

  //! The bytes implementing \a op
  /*! Throws an unsupported exception if the dialect has no command
   *  for \a op.
   */
  const byte_buffer& command (operation op) const;

  bool has_command (operation op) const;

  //! Barcode module width to use for a \a requested width
  /*! Out of range requests are replaced by the model's default.  Not
   *  every model honours the request at all.
   */
  virtual uint8_t barcode_width (int requested) const = 0;

  virtual status_protocol status_protocol_type () const = 0;

  //! Seconds the printer needs after a cut before it takes new input
  virtual double settle_time () const;

  //! Guesses the dialect from USB identification data
  /*! Devices in SNBC's API mode do not report a manufacturer so they
   *  are recognized by their vendor and product ids.  All others are
   *  recognized by the start of their manufacturer string.
   */
  static ptr infer (uint16_t vendor_id, uint16_t product_id,
                    const std::string& manufacturer);

  //! Finds a dialect by (case-insensitive) \a name
  /*! Recognized names are \c snbc, \c p3, \c epic and \c unknown.
   *  Throws an invalid_argument exception for anything else.
   */
  static ptr lookup (const std::string& name);

  static ptr get (model m);

protected:
  dialect (model m, const std::string& name);

  void add_feature_(feature f);
  void add_command_(operation op, const byte_buffer& bytes);

private:
  model id_;
  std::string name_;
  std::set< feature > features_;
  std::map< operation, byte_buffer > commands_;
};

} // namespace escpos
} // namespace _drv_
} // namespace insatsu

#endif  /* drivers_escpos_dialect_hpp_ */
