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

#include <cstdio>
#include <boost/filesystem.hpp>
#include "smap_settings.hpp"

smap_mapconfig::smap_mapconfig() :
    lat(47.6386),
    lon(6.8631),
    zoom(13),
    zoommin(10),
    zoommax(19)
{
    ;
}

smap_settings::smap_settings(const std::string &path) :
    m_path(path)
{
    smap_tileconfig defaults;
    smap_mapconfig mapdefaults;

    // Set some important base options
    setopt("tiles::url", defaults.url);
    setopt("tiles::cachedir", defaults.cachedir);
    setopt("tiles::useragent", defaults.useragent);
    setopt("tiles::workers", defaults.workers);
    setopt("tiles::timeout", defaults.timeout);
    setopt("tiles::cooldown", defaults.cooldown);
    setopt("tiles::preload", defaults.preload);
    setopt("tiles::verbose", defaults.verbose ? 1 : 0);
    setopt("map::lat", mapdefaults.lat);
    setopt("map::lon", mapdefaults.lon);
    setopt("map::zoom", mapdefaults.zoom);
    setopt("map::zoommin", mapdefaults.zoommin);
    setopt("map::zoommax", mapdefaults.zoommax);

    // Load config file overwriting any previously set defaults
    load();
}

smap_settings::~smap_settings()
{
    ;
}

int smap_settings::serialize()
{
    // Create the directory holding the settings file if needed
    boost::filesystem::path dir = boost::filesystem::path(m_path).parent_path();
    if (!dir.empty()) {
        boost::system::error_code ec;
        boost::filesystem::create_directories(dir, ec);
        if (ec) {
            fprintf(stderr, "Couldn't create '%s': %s\n", dir.string().c_str(), ec.message().c_str());
            return 1;
        }
    }

    TiXmlDocument doc;
    TiXmlDeclaration *decl = new TiXmlDeclaration("1.0", "", "");
    doc.LinkEndChild(decl);

    TiXmlElement *settings = new TiXmlElement("settings");

    for (std::map<std::string,std::string>::iterator it=m_settings.begin();it!=m_settings.end();++it) {
        TiXmlElement *opt = new TiXmlElement("option");
        TiXmlElement *key = new TiXmlElement("key");
        TiXmlElement *val = new TiXmlElement("value");

        key->LinkEndChild(new TiXmlText(it->first));
        val->LinkEndChild(new TiXmlText(it->second));

        opt->LinkEndChild(key);
        opt->LinkEndChild(val);
        settings->LinkEndChild(opt);
    }

    doc.LinkEndChild(settings);
    if (!doc.SaveFile(m_path)) {
        fprintf(stderr, "Couldn't write settings to '%s'\n", m_path.c_str());
        return 1;
    }

    return 0;
}

int smap_settings::load()
{
    TiXmlDocument doc(m_path);
    if (!doc.LoadFile())
        return 1;

    if (doc.RootElement() == NULL)
        return 1;

    return parsetree(doc.RootElement());
}

int smap_settings::parsetree(TiXmlNode *parent)
{
    if (parent->Type() != TiXmlNode::TINYXML_ELEMENT)
        return 0;

    std::string val(parent->Value());

    // Handle config option tree
    if (val.compare("option") == 0) {
        std::string key, value;
        bool havekey = false;

        // Get key and value child elements
        for (TiXmlElement *child = parent->FirstChildElement(); child != NULL; child = child->NextSiblingElement()) {
            const char *text = child->GetText();

            if (std::string(child->Value()).compare("key") == 0) {
                if (text) {
                    key = text;
                    havekey = true;
                }
            } else if (std::string(child->Value()).compare("value") == 0) {
                value = text ? text : "";
            }
        }

        if (havekey)
            m_settings[key] = value;
    } else {
        // Recurse non-"option" subtree
        for (TiXmlNode *child = parent->FirstChild(); child != NULL; child = child->NextSibling())
            parsetree(child);
    }

    return 0;
}

int smap_settings::tileconfig(smap_tileconfig &cfg)
{
    int rc = 0;
    int verbose = 0;

    rc |= getopt(std::string("tiles::url"), cfg.url);
    rc |= getopt(std::string("tiles::cachedir"), cfg.cachedir);
    rc |= getopt(std::string("tiles::useragent"), cfg.useragent);
    rc |= getopt(std::string("tiles::workers"), cfg.workers);
    rc |= getopt(std::string("tiles::timeout"), cfg.timeout);
    rc |= getopt(std::string("tiles::cooldown"), cfg.cooldown);
    rc |= getopt(std::string("tiles::preload"), cfg.preload);
    rc |= getopt(std::string("tiles::verbose"), verbose);
    cfg.verbose = (verbose != 0);

    return (rc == 0) ? 0 : 1;
}

int smap_settings::mapconfig(smap_mapconfig &cfg)
{
    int rc = 0;

    rc |= getopt(std::string("map::lat"), cfg.lat);
    rc |= getopt(std::string("map::lon"), cfg.lon);
    rc |= getopt(std::string("map::zoom"), cfg.zoom);
    rc |= getopt(std::string("map::zoommin"), cfg.zoommin);
    rc |= getopt(std::string("map::zoommax"), cfg.zoommax);

    return (rc == 0) ? 0 : 1;
}
