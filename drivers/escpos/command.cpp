//  command.cpp -- chainable ESC/POS print commands
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

#include "command.hpp"
#include "printer.hpp"

namespace insatsu {
namespace _drv_ {
namespace escpos {

using placeholders::_1;

namespace cmd {

command
init ()
{
  return command (bind (&printer::init, _1));
}

command
enable ()
{
  return command (bind (&printer::enable, _1));
}

command
disable ()
{
  return command (bind (&printer::disable, _1));
}

command
align (const std::string& token)
{
  return command (bind (&printer::align, _1, token));
}

command
font (const std::string& token)
{
  return command (bind (&printer::font, _1, token));
}

command
style (const std::string& token)
{
  return command (bind (&printer::style, _1, token));
}

command
underline (const std::string& token)
{
  return command (bind (&printer::underline, _1, token));
}

command
size (int width, int height)
{
  return command (bind (&printer::size, _1, width, height));
}

command
char_size (uint8_t n)
{
  return command (bind (&printer::char_size, _1, n));
}

command
line_space (int n)
{
  return command (bind (&printer::line_space, _1, n));
}

command
feed (int lines)
{
  return command (bind (&printer::feed, _1, lines));
}

command
control (const std::string& token)
{
  return command (bind (&printer::control, _1, token));
}

command
cashdraw (int pin)
{
  return command (bind (&printer::cashdraw, _1, pin));
}

command
print (const std::string& text)
{
  return command (bind (&printer::print, _1, text));
}

command
println (const std::string& text)
{
  return command (bind (&printer::println, _1, text));
}

command
text (const std::string& text)
{
  return command (bind (&printer::text, _1, text));
}

command
hr (int width)
{
  return command (bind (&printer::hr, _1, width));
}

command
cut ()
{
  return command (bind (&printer::cut, _1));
}

command
partial_cut ()
{
  return command (bind (&printer::partial_cut, _1));
}

command
barcode (const barcode_spec& spec, const std::string& text)
{
  return command (bind (&printer::barcode, _1, spec, text));
}

command
qrcode (const std::string& text, int version,
        const std::string& level, int size)
{
  return command (bind (&printer::qrcode, _1, text, version, level, size));
}

command
raster (const bitmap& image, raster_mode mode)
{
  return command (bind (&printer::raster, _1, image, mode));
}

command
bit_image (const bitmap& image, bit_image_density density)
{
  return command (bind (&printer::bit_image, _1, image, density));
}

command
enable_asb ()
{
  return command (bind (&printer::enable_asb, _1));
}

command
set_paper_end_limit (int cm)
{
  return command (bind (&printer::set_paper_end_limit, _1, cm));
}

}       // namespace cmd

printer&
operator<< (printer& p, const command& cmd)
{
  cmd (p);
  return p;
}

} // namespace escpos
} // namespace _drv_
} // namespace insatsu
