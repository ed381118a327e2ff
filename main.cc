#include <string.h>
#include <stdio.h>
#include <stdlib.h>
#include <getopt.h>

#include <string>

#include <FL/Fl.H>
#include <FL/Fl_Double_Window.H>

#include "smap_settings.hpp"
#include "smap_tilemanager.hpp"
#include "smap_tilelayer.hpp"
#include "smap_mapctrl.hpp"


// window geometry
#define WINDOW_W 1000
#define WINDOW_H 800

static void cb_slippymap( Fl_Widget* widget, void* cookie );
static void redraw_slippymap( void* mapctrl );

int main(int argc, char** argv)
{
  std::string config;
  double      lat     = -1000.0;
  double      lon     = -1000.0;
  int         zoom    = -1;
  int         workers = -1;
  int         verbose = 0;

  const char* usage =
    "%s [--config settings.xml] [--lat lat] [--lon lon] [--zoom z]\n"
    "   [--workers n] [--verbose] [--help]\n"
    "  Opens a slippy map window. Tiles are cached in memory and under the\n"
    "  configured cache directory.\n"
    "  Without --config, settings are read from ~/.slipmap/settings.xml.\n"
    "  --lat, --lon, --zoom and --workers override the settings file.\n";

  struct option long_options[] =
    {
      {"config",   required_argument, NULL, 'c' },
      {"lat",      required_argument, NULL, 'a' },
      {"lon",      required_argument, NULL, 'o' },
      {"zoom",     required_argument, NULL, 'z' },
      {"workers",  required_argument, NULL, 'w' },
      {"verbose",  no_argument,       NULL, 'v' },
      {"help",     no_argument,       NULL, 'h' },
      {}
    };

  int getopt_res;
  do
  {
    getopt_res = getopt_long(argc, argv, "", long_options, NULL);
    switch( getopt_res )
    {
    case '?':
      fprintf(stderr, "Unknown cmdline option encountered\nUsage: ");
      fprintf(stderr, usage, argv[0]);
      return 1;

    case 'h':
      fprintf(stdout, usage, argv[0]);
      return 0;

    case 'c':
      config = optarg;
      break;

    case 'a':
      lat = atof(optarg);
      break;

    case 'o':
      lon = atof(optarg);
      break;

    case 'z':
      zoom = atoi(optarg);
      break;

    case 'w':
      workers = atoi(optarg);
      if( workers < 1 )
      {
        fprintf(stderr, "--workers needs a positive count\n");
        return 1;
      }
      break;

    case 'v':
      verbose = 1;
      break;

    default: ;
    }
  } while(getopt_res != -1);

  if( config.empty() )
  {
    const char* home = getenv("HOME");
    config = std::string(home ? home : ".") + "/.slipmap/settings.xml";
  }

  smap_settings settings(config);

  smap_tileconfig tilecfg;
  if( settings.tileconfig(tilecfg) != 0 )
    fprintf(stderr, "Some tile settings in '%s' are malformed, using defaults for those\n",
            config.c_str());

  if( workers > 0 )
    tilecfg.workers = workers;
  if( verbose )
    tilecfg.verbose = true;

  smap_mapconfig mapcfg;
  if( settings.mapconfig(mapcfg) != 0 )
    fprintf(stderr, "Some map settings in '%s' are malformed, using defaults for those\n",
            config.c_str());

  if( lat > -500.0 ) mapcfg.lat  = lat;
  if( lon > -500.0 ) mapcfg.lon  = lon;
  if( zoom >= 0 )    mapcfg.zoom = zoom;

  // Write the defaults out the first time round, so there's a file to edit
  settings.serialize();

  smap_tilemanager tiles(tilecfg);

  Fl::lock();

  smap_mapctrl*   mapctrl;
  smap_tilelayer* tilelayer;

  Fl_Double_Window* window = new Fl_Double_Window( WINDOW_W, WINDOW_H, "Slippy map" );
  window->align(Fl_Align(FL_ALIGN_CLIP|FL_ALIGN_INSIDE));
  {
    mapctrl = new smap_mapctrl( 0, 0, window->w(), window->h(), "Slippy Map" );
    mapctrl->box(FL_NO_BOX);
    mapctrl->color(FL_BACKGROUND_COLOR);
    mapctrl->selection_color(FL_BACKGROUND_COLOR);
    mapctrl->labeltype(FL_NORMAL_LABEL);
    mapctrl->labelfont(0);
    mapctrl->labelsize(14);
    mapctrl->labelcolor(FL_FOREGROUND_COLOR);
    mapctrl->align(Fl_Align(FL_ALIGN_CENTER));

    tilelayer = new smap_tilelayer( tiles, tilecfg.preload );
    tilelayer->callback( &redraw_slippymap, mapctrl );

    if( mapctrl->zoomrange(mapcfg.zoommin, mapcfg.zoommax) != 0 )
      fprintf(stderr, "Ignoring invalid zoom range %d..%d\n", mapcfg.zoommin, mapcfg.zoommax);
    mapctrl->zoom_set(mapcfg.zoom);
    mapctrl->center_at(mapcfg.lat, mapcfg.lon);
    mapctrl->basemap(tilelayer);

    // callback for the right mouse button
    mapctrl->callback( &cb_slippymap, NULL );
  }

  window->resizable(mapctrl);
  window->end();
  window->show(argc, argv);

  int rc = Fl::run();

  // Workers may be waiting for the FLTK lock in their callback. Let them
  // finish, they have to be gone before the layer they call back into.
  Fl::unlock();
  tiles.shutdown();
  delete tilelayer;

  return rc;
}

static void redraw_slippymap( void* mapctrl )
{
  reinterpret_cast<smap_mapctrl*>(mapctrl)->redraw();
}

static void cb_slippymap(Fl_Widget* widget,
                         void*      cookie __attribute__((unused)) )
{
  if( Fl::event_button() != FL_RIGHT_MOUSE )
    return;

  double lat, lon;
  if( reinterpret_cast<smap_mapctrl*>(widget)->mousegps(lat, lon) == 0 )
    fprintf(stdout, "%.6f,%.6f\n", lat, lon);
}
