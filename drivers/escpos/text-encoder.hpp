//  text-encoder.hpp -- character set conversion of text payloads
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

#ifndef drivers_escpos_text_encoder_hpp_
#define drivers_escpos_text_encoder_hpp_

#include <string>

#include "buffer.hpp"

namespace insatsu {
namespace _drv_ {
namespace escpos {

//! Converts UTF-8 text to the printer's character set
/*! The conversion is done with iconv(3) so any code set the C library
 *  knows about can be used.  What happens to characters that have no
 *  representation in the target code set, and to malformed input, is
 *  controlled by the policy.
 */
class text_encoder
{
public:
  typedef enum {
    STRICT,                     //!< throw an invalid_argument
    REPLACE,                    //!< substitute the replacement byte
    SKIP,                       //!< drop the character
  } policy;

  text_encoder (const std::string& code_set = "UTF-8",
                policy p = REPLACE, byte replacement = QUESTION);

  const std::string& code_set () const;
  policy invalid_policy () const;

  byte_buffer operator() (const std::string& utf8) const;

private:
  std::string code_set_;
  policy policy_;
  byte replacement_;
};

} // namespace escpos
} // namespace _drv_
} // namespace insatsu

#endif  /* drivers_escpos_text_encoder_hpp_ */
