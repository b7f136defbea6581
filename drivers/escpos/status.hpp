//  status.hpp -- printer condition flags and their decoding
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

#ifndef drivers_escpos_status_hpp_
#define drivers_escpos_status_hpp_

#include <ostream>
#include <string>
#include <vector>

#include "code-point.hpp"

namespace insatsu {
namespace _drv_ {
namespace escpos {

//! The set of conditions a printer reported
/*! A status is not an error in itself.  It collects all conditions
 *  that were found in a status reply, including the ones that merely
 *  confirm that the printer is fine (such as \c ONLINE).
 */
class status
{
public:
  typedef enum {
    COMMUNICATION             = 1 << 0,
    ONLINE                    = 1 << 1,
    OFFLINE                   = 1 << 2,
    DOOR_OPEN                 = 1 << 3,
    PAPER_FEED                = 1 << 4,
    AUTO_CUTTER               = 1 << 5,
    RECOVERABLE               = 1 << 6,
    AUTOMATICALLY_RECOVERABLE = 1 << 7,
    PAPER_NEAR_END            = 1 << 8,
    PAPER_END                 = 1 << 9,
  } condition;

  //! One line of a decoding table
  /*! The byte at \a index matches if its bits under \a mask equal \a
   *  value.  A match adds \a flag, a mismatch adds \a otherwise (if
   *  not zero).
   */
  struct rule
  {
    streamsize index;
    byte mask;
    byte value;
    unsigned flag;
    unsigned otherwise;
  };

  status ();

  bool empty () const;
  streamsize size () const;
  bool contains (condition c) const;

  //! Whether anything besides \c ONLINE was reported
  bool is_fault () const;

  void insert (condition c);

  //! The conditions contained, in declaration order
  std::vector< condition > conditions () const;

  bool operator== (const status& that) const;
  bool operator!= (const status& that) const;

  //! Applies a decoding \a table to the first \a size bytes at \a data
  /*! Rules referring to bytes beyond \a size are skipped.
   */
  static status decode (const byte *data, streamsize size,
                        const std::vector< rule >& table);

  //! Table for the 16 byte status block of SNBC class printers
  /*! \note The paper sensor fields are two bits wide and only count
   *        as set when both bits are.  That is what the hardware has
   *        been observed to report.  Printer documentation may say
   *        otherwise.
   */
  static const std::vector< rule >& block_rules ();

  //! Table for the four real-time poll replies of Epic class printers
  static const std::vector< rule >& poll_rules ();

  static std::string name (condition c);

private:
  unsigned flags_;
};

std::ostream& operator<< (std::ostream& os, const status& s);

} // namespace escpos
} // namespace _drv_
} // namespace insatsu

#endif  /* drivers_escpos_status_hpp_ */
