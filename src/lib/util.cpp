/*
Copyright 2013-present, SINTEF Ocean.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include <fmuhandler/util.hpp>

#include <cstring>
#include <stdexcept>

#include <boost/random/random_device.hpp>
#include <boost/random/uniform_int_distribution.hpp>


std::string fmuhandler::util::RandomString(std::size_t size, const char* charSet)
{
    if (charSet == nullptr) {
        throw std::invalid_argument("charSet is null");
    }
    const auto charSetSize = std::strlen(charSet);
    if (charSetSize < 1) {
        throw std::invalid_argument("Empty character set");
    }
    boost::random::random_device rng;
    auto dist = boost::random::uniform_int_distribution<std::size_t>{0u, charSetSize-1};
    auto ret = std::string(size, '\xFF');
    for (char& c : ret) {
        c = charSet[dist(rng)];
    }
    return ret;
}
