// Copyright (c) 2010, Björn Rehm (bjoern@shugaa.de)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#ifndef _SMAP_SETTINGS_HPP
#define _SMAP_SETTINGS_HPP

#include <string>
#include <tinyxml.h>
#include <sstream>
#include <map>
#include "smap_tilemanager.hpp"

// Where the map opens and how far it zooms
struct smap_mapconfig {
    smap_mapconfig();

    double lat;
    double lon;
    int zoom;
    int zoommin;
    int zoommax;
};

// Key/value settings kept in an XML file. Defaults are set on construction,
// the file (if it exists) overrides them.
class smap_settings
{
    public:
        smap_settings(const std::string &path);
        ~smap_settings();

        int load();
        int serialize();

        // Fill a tile manager configuration from the tiles:: keys
        int tileconfig(smap_tileconfig &cfg);

        // Same for the map:: keys. Malformed values leave cfg untouched.
        int mapconfig(smap_mapconfig &cfg);

        const std::string& path() const { return m_path; };

        template <class T>
        int getopt(const std::string& key, T& t)
        {
            std::map<std::string,std::string>::iterator it;

            // Try to find the key
            it = m_settings.find(key);
            if (it == m_settings.end())
                return 1;

            // Parse aside, a failed extraction zeroes its target
            T val;
            std::istringstream iss((*it).second);
            if ((iss >> val).fail())
                return 1;

            t = val;
            return 0;
        }

        template <class T>
        int setopt(const std::string& key, const T& t)
        {
            std::ostringstream oss;
            oss.precision(12);
            oss << t;

            m_settings[key] = oss.str();
            return 0;
        }

    private:
        smap_settings(const smap_settings&);
        smap_settings& operator=(const smap_settings&);

        int parsetree(TiXmlNode *parent);

        std::string m_path;
        std::map<std::string, std::string> m_settings;
};

// Strings may contain blanks, don't let operator>> split them
template <>
inline int smap_settings::getopt<std::string>(const std::string& key, std::string& t)
{
    std::map<std::string,std::string>::iterator it = m_settings.find(key);
    if (it == m_settings.end())
        return 1;

    t = it->second;
    return 0;
}

#endif // _SMAP_SETTINGS_HPP
