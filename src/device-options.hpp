//  device-options.hpp -- printer selection on the command-line
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

#ifndef src_device_options_hpp_
#define src_device_options_hpp_

#include <string>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

#include <insatsu/memory.hpp>

#include "drivers/escpos/printer.hpp"

namespace insatsu {

//! Command-line options that select and open a printer
/*! Shared by the free-standing commands that talk to a printer.  A
 *  printer is addressed either by USB vendor and product ID or by a
 *  device node.  Its dialect is given explicitly or inferred from the
 *  USB descriptors.
 */
class device_options
{
public:
  device_options ();

  const boost::program_options::options_description& description () const;

  //! Opens the printer the parsed options in \a vm refer to
  /*! Throws a \c std::runtime_error if no printer was selected.
   */
  shared_ptr< _drv_::escpos::printer >
  open (const boost::program_options::variables_map& vm,
        const _drv_::escpos::text_encoder& encoder
        = _drv_::escpos::text_encoder ()) const;

private:
  _drv_::escpos::dialect::ptr
  dialect_(const std::string& model, const std::string& usb_path) const;

  boost::program_options::options_description desc_;
};

} // namespace insatsu

#endif /* src_device_options_hpp_ */
