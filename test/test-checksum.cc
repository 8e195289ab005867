// ==========================================================================
//                ---  RTrace - Route Tracing Engine  ---
// ==========================================================================
//
// RTrace - Route Tracing Engine
// Copyright (C) 2025 by the RTrace developers
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <iostream>
#include <vector>

#include "tools.h"
#include "internet16.h"
#include "ipv4header.h"
#include "logger.h"


// ###### RFC 1071 example ##################################################
static void testRFC1071Example()
{
   const uint8_t data[] = { 0x00, 0x01, 0xf2, 0x03, 0xf4, 0xf5, 0xf6, 0xf7 };
   uint32_t sum = 0;
   processInternet16(sum, data, sizeof(data));
   assure(sum == 0xddf2);
   assure(finishInternet16(sum) == 0x220d);
}


// ###### Odd number of bytes ###############################################
static void testOddLength()
{
   const uint8_t data[] = { 0x12, 0x34, 0x56 };
   uint32_t sum = 0;
   processInternet16(sum, data, sizeof(data));
   // The final byte is padded with zero: 0x1234 + 0x5600
   assure(sum == 0x6834);

   uint32_t empty = 0;
   processInternet16(empty, data, 0);
   assure(empty == 0);
   assure(finishInternet16(empty) == 0xffff);
}


// ###### Incremental computation ###########################################
static void testIncremental()
{
   std::vector<uint8_t> data(1500);
   for(size_t i = 0; i < data.size(); i++) {
      data[i] = static_cast<uint8_t>((i * 7) & 0xff);
   }

   uint32_t total = 0;
   processInternet16(total, data.data(), data.size());

   // Split at even offsets, as done for header after header:
   uint32_t pieces = 0;
   processInternet16(pieces, data.data(), 20);
   processInternet16(pieces, data.data() + 20, 8);
   processInternet16(pieces, data.data() + 28, 16);
   processInternet16(pieces, data.data() + 44, data.size() - 44);
   assure(finishInternet16(total) == finishInternet16(pieces));

   // Large input of 0xff bytes must not overflow:
   const std::vector<uint8_t> ones(65000, 0xff);
   uint32_t onesSum = 0;
   processInternet16(onesSum, ones.data(), ones.size());
   assure(finishInternet16(onesSum) == 0x0000);
}


// ###### IPv4 header checksum ##############################################
static void testIPv4HeaderChecksum()
{
   IPv4Header ipv4Header;
   ipv4Header.typeOfService(0x10);
   ipv4Header.totalLength(84);
   ipv4Header.identification(0x1c46);
   ipv4Header.dontFragment(true);
   ipv4Header.timeToLive(7);
   ipv4Header.protocol(17);
   ipv4Header.sourceAddress(boost::asio::ip::make_address_v4("192.0.2.1"));
   ipv4Header.destinationAddress(boost::asio::ip::make_address_v4("198.51.100.7"));

   ipv4Header.updateChecksum();
   assure(ipv4Header.headerChecksum() != 0);

   // A header including its correct checksum sums up to 0xffff:
   uint32_t verify = 0;
   ipv4Header.processInternet16(verify);
   assure(finishInternet16(verify) == 0);

   assure(ipv4Header.dontFragment());
   assure(!ipv4Header.moreFragments());
   assure(ipv4Header.fragmentOffset() == 0);
   assure(ipv4Header.headerLength() == 20);
   assure(!ipv4Header.isFragment());

   // Changing a field invalidates the checksum until it is updated again:
   ipv4Header.fragmentOffset(185);
   assure(ipv4Header.dontFragment());
   assure(ipv4Header.fragmentOffset() == 185);
   assure(ipv4Header.isFragment());
   verify = 0;
   ipv4Header.processInternet16(verify);
   assure(finishInternet16(verify) != 0);
   ipv4Header.updateChecksum();
   verify = 0;
   ipv4Header.processInternet16(verify);
   assure(finishInternet16(verify) == 0);
}


// ###### Main program ######################################################
int main(int argc, char** argv)
{
   initialiseLogger(boost::log::trivial::severity_level::warning, false);

   testRFC1071Example();
   testOddLength();
   testIncremental();
   testIPv4HeaderChecksum();

   std::cout << "Checksum tests passed\n";
   return 0;
}
