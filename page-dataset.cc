/**
 * Tool that converts Page XML exports into image and text datasets
 *
 * @version $Version: 2025.10.17$
 * @copyright Copyright (c) 2016-present, Mauricio Villegas <mauricio_ville@yahoo.com>
 * @license MIT License
 */

/*** Includes *****************************************************************/
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>
#include <limits.h>
#include <string>
#include <vector>
#include <getopt.h>
#include <sys/stat.h>

#include <curl/curl.h>

#include "PageParser.h"
#include "PageSource.h"
#include "PageImage.h"
#include "PageExporter.h"
#include "DatasetWriter.h"

/*** Definitions **************************************************************/
static char tool[] = "page-dataset";
static char version[] = "Version: 2025.10.17";

char *gb_namespace = NULL;
char *gb_output = NULL;
char *gb_modename = NULL;
int gb_mode = PAGEDS_EXPORT_TEXT;
int gb_window_size = 2;
int gb_overlap = 0;
bool gb_mask_crop = false;
int gb_min_width = 0;
bool gb_allow_empty = false;
bool gb_stats_only = false;
double gb_split_train = 0.0;
unsigned gb_split_seed = 42;
bool gb_split_shuffle = false;

enum {
  OPTION_OUTPUT      = 'o',
  OPTION_HELP        = 'h',
  OPTION_VERSION     = 'v',
  OPTION_MODE        = 256,
  OPTION_NAMESPACE        ,
  OPTION_WINDOWSIZE       ,
  OPTION_OVERLAP          ,
  OPTION_MASKCROP         ,
  OPTION_MINWIDTH         ,
  OPTION_ALLOWEMPTY       ,
  OPTION_STATSONLY        ,
  OPTION_SPLITTRAIN       ,
  OPTION_SPLITSEED        ,
  OPTION_SPLITSHUFFLE
};

static char gb_short_options[] = "o:hv";

static struct option gb_long_options[] = {
    { "output-dir",    required_argument, NULL, OPTION_OUTPUT },
    { "help",          no_argument,       NULL, OPTION_HELP },
    { "version",       no_argument,       NULL, OPTION_VERSION },
    { "mode",          required_argument, NULL, OPTION_MODE },
    { "namespace",     required_argument, NULL, OPTION_NAMESPACE },
    { "window-size",   required_argument, NULL, OPTION_WINDOWSIZE },
    { "overlap",       required_argument, NULL, OPTION_OVERLAP },
    { "mask-crop",     no_argument,       NULL, OPTION_MASKCROP },
    { "min-width",     required_argument, NULL, OPTION_MINWIDTH },
    { "allow-empty",   no_argument,       NULL, OPTION_ALLOWEMPTY },
    { "stats-only",    no_argument,       NULL, OPTION_STATSONLY },
    { "split-train",   required_argument, NULL, OPTION_SPLITTRAIN },
    { "split-seed",    required_argument, NULL, OPTION_SPLITSEED },
    { "split-shuffle", no_argument,       NULL, OPTION_SPLITSHUFFLE },
    { 0, 0, 0, 0 }
  };

/*** Functions ****************************************************************/
#define strbool( cond ) ( ( cond ) ? "true" : "false" )

void print_usage() {
  fprintf( stderr, "Description: Converts Page XML exports (directory or zip) into image and text datasets\n" );
  fprintf( stderr, "Usage: %s [OPTIONS] SOURCE\n", tool );
  fprintf( stderr, "Options:\n" );
  fprintf( stderr, " --mode MODE             Export mode: raw, raw_xml, text, region, line, window (def.=%s)\n", PageExporter::modeNames[gb_mode] );
  fprintf( stderr, " --namespace NS          Namespace of the Page XML files (def.=%s)\n", PageParser::defaultNamespace );
  fprintf( stderr, " --window-size N         Number of lines per window, window mode (def.=%d)\n", gb_window_size );
  fprintf( stderr, " --overlap N             Lines shared by consecutive windows, window mode (def.=%d)\n", gb_overlap );
  fprintf( stderr, " --mask-crop             Set to white the area outside of the polygons (def.=%s)\n", strbool(gb_mask_crop) );
  fprintf( stderr, " --min-width N           Minimum width of region and line crops (def.=none)\n" );
  fprintf( stderr, " --allow-empty           Include regions and lines without text (def.=%s)\n", strbool(gb_allow_empty) );
  fprintf( stderr, " --stats-only            Only print statistics of the source (def.=%s)\n", strbool(gb_stats_only) );
  fprintf( stderr, " --split-train R         Ratio of records for the train split, between 0 and 1 (def.=no split)\n" );
  fprintf( stderr, " --split-seed N          Random seed for the split shuffle (def.=%u)\n", gb_split_seed );
  fprintf( stderr, " --split-shuffle         Shuffle the records before splitting (def.=%s)\n", strbool(gb_split_shuffle) );
  fprintf( stderr, " -o, --output-dir DIR    Output directory (def.=./pagexml_dataset_MODE[_wN_oM])\n" );
  fprintf( stderr, " -h, --help              Print this usage information and exit\n" );
  fprintf( stderr, " -v, --version           Print version and exit\n" );
  fprintf( stderr, "Examples:\n" );
  fprintf( stderr, "  %s --stats-only export.zip\n", tool );
  fprintf( stderr, "  %s --mode line --mask-crop --min-width 32 -o lines export.zip\n", tool );
  fprintf( stderr, "  %s --mode window --window-size 3 --overlap 1 --split-train 0.8 --split-shuffle export_dir\n", tool );
}

static bool parseIntArg( const char* arg, int& value ) {
  char* end = NULL;
  errno = 0;
  long num = strtol( arg, &end, 10 );
  if( end == arg || *end != '\0' || errno != 0 || num > INT_MAX || num < INT_MIN )
    return false;
  value = (int)num;
  return true;
}

static void print_stats( const PageStats& stats ) {
  fprintf( stdout, "Dataset Statistics:\n" );
  fprintf( stdout, "  Total pages: %d\n", stats.totalPages );
  fprintf( stdout, "  Total regions: %d\n", stats.totalRegions );
  fprintf( stdout, "  Total lines: %d\n", stats.totalLines );
  std::string projects;
  for( size_t n=0; n<stats.projects.size(); n++ )
    projects += ( n == 0 ? "" : ", " ) + stats.projects[n];
  fprintf( stdout, "  Projects: %s\n", projects.c_str() );
  fprintf( stdout, "  Avg regions per page: %.1f\n", stats.avgRegionsPerPage );
  fprintf( stdout, "  Avg lines per page: %.1f\n", stats.avgLinesPerPage );
  if( gb_mode == PAGEDS_EXPORT_WINDOW )
    fprintf( stdout, "  Windows (window_size=%d, overlap=%d): %d\n", gb_window_size, gb_overlap, stats.totalWindows );
}

/*** Program ******************************************************************/
int main( int argc, char *argv[] ) {

  /// Parse input arguments ///
  int n;
  bool min_width_set = false;
  char *end;
  while ( ( n = getopt_long(argc,argv,gb_short_options,gb_long_options,NULL) ) != -1 )
    switch ( n ) {
      case OPTION_MODE:
        gb_mode = PageExporter::parseMode(optarg);
        if ( gb_mode < 0 ) {
          fprintf( stderr, "%s: error: invalid mode: %s\n", tool, optarg );
          return 1;
        }
        gb_modename = optarg;
        break;
      case OPTION_NAMESPACE:
        gb_namespace = optarg;
        break;
      case OPTION_WINDOWSIZE:
        if ( ! parseIntArg( optarg, gb_window_size ) ) {
          fprintf( stderr, "%s: error: invalid window size: %s\n", tool, optarg );
          return 1;
        }
        break;
      case OPTION_OVERLAP:
        if ( ! parseIntArg( optarg, gb_overlap ) ) {
          fprintf( stderr, "%s: error: invalid overlap: %s\n", tool, optarg );
          return 1;
        }
        break;
      case OPTION_MASKCROP:
        gb_mask_crop = true;
        break;
      case OPTION_MINWIDTH:
        if ( ! parseIntArg( optarg, gb_min_width ) ) {
          fprintf( stderr, "%s: error: invalid minimum width: %s\n", tool, optarg );
          return 1;
        }
        min_width_set = true;
        break;
      case OPTION_ALLOWEMPTY:
        gb_allow_empty = true;
        break;
      case OPTION_STATSONLY:
        gb_stats_only = true;
        break;
      case OPTION_SPLITTRAIN:
        errno = 0;
        gb_split_train = strtod( optarg, &end );
        if ( end == optarg || *end != '\0' || errno != 0 || ! ( gb_split_train > 0.0 && gb_split_train < 1.0 ) ) {
          fprintf( stderr, "%s: error: --split-train has to be between 0 and 1, got: %s\n", tool, optarg );
          return 1;
        }
        break;
      case OPTION_SPLITSEED:
        errno = 0;
        gb_split_seed = (unsigned)strtoul( optarg, &end, 10 );
        if ( end == optarg || *end != '\0' || errno != 0 ) {
          fprintf( stderr, "%s: error: invalid split seed: %s\n", tool, optarg );
          return 1;
        }
        break;
      case OPTION_SPLITSHUFFLE:
        gb_split_shuffle = true;
        break;
      case OPTION_OUTPUT:
        gb_output = optarg;
        break;
      case OPTION_HELP:
        print_usage();
        return 0;
      case OPTION_VERSION:
        fprintf( stderr, "%s %s\n", tool, version+9 );
        PageParser::printVersions( stderr );
        return 0;
      default:
        fprintf( stderr, "%s: error: incorrect input argument: %s\n", tool, argv[optind-1] );
        return 1;
    }

  /// Check that there is exactly one non-option argument ///
  if ( optind != argc-1 ) {
    fprintf( stderr, "%s: error: exactly one source directory or zip file must be provided, see usage with --help\n", tool );
    return 1;
  }
  char *source_path = argv[optind];

  /// Validate arguments ///
  struct stat st;
  if ( stat( source_path, &st ) != 0 ) {
    fprintf( stderr, "%s: error: source path does not exist: %s\n", tool, source_path );
    return 1;
  }
  if ( min_width_set && gb_min_width <= 0 ) {
    fprintf( stderr, "%s: error: --min-width has to be a positive integer\n", tool );
    return 1;
  }
  if ( gb_mode == PAGEDS_EXPORT_WINDOW ) {
    if ( gb_window_size < 1 ) {
      fprintf( stderr, "%s: error: --window-size must be at least 1\n", tool );
      return 1;
    }
    if ( gb_overlap < 0 ) {
      fprintf( stderr, "%s: error: --overlap cannot be negative\n", tool );
      return 1;
    }
    if ( gb_overlap >= gb_window_size ) {
      fprintf( stderr, "%s: error: --overlap must be less than --window-size\n", tool );
      return 1;
    }
  }

  /// Default output directory ///
  std::string output_dir;
  if ( gb_output != NULL )
    output_dir = gb_output;
  else {
    output_dir = std::string("./pagexml_dataset_") + ( gb_modename != NULL ? gb_modename : PageExporter::modeNames[gb_mode] );
    if ( gb_mode == PAGEDS_EXPORT_WINDOW )
      output_dir += "_w" + std::to_string(gb_window_size) + "_o" + std::to_string(gb_overlap);
  }

  curl_global_init( CURL_GLOBAL_DEFAULT );
  int status = 0;
  PageSource* source = NULL;

  try {
    /// Parse the Page XML files ///
    source = PageSource::open( source_path );
    PageParser parser( gb_namespace );
    std::vector<PageData> pages = parser.parseSource( *source );

    if ( gb_stats_only ) {
      print_stats( PageParser::getStats( pages, gb_mode == PAGEDS_EXPORT_WINDOW ? gb_window_size : 0, gb_overlap ) );
    }

    /// Export records ///
    else {
      ExportConfig config;
      config.mode = (PAGEDS_EXPORT_MODE)gb_mode;
      config.windowSize = gb_window_size;
      config.overlap = gb_overlap;
      config.mask = gb_mask_crop;
      config.minWidth = gb_min_width;
      config.allowEmpty = gb_allow_empty;

      ImageLoader loader( source );
      PageExporter exporter( pages, loader, config );
      DatasetWriter writer( output_dir.c_str(), config.mode );

      DatasetRecord record;
      while ( exporter.next( record ) )
        writer.add( record );

      writer.write( gb_split_train, gb_split_shuffle, gb_split_seed );
      exporter.printSummary( stdout );
      fprintf( stdout, "Dataset saved to: %s\n", output_dir.c_str() );
    }
  } catch ( const std::exception& e ) {
    fprintf( stderr, "%s: error: %s\n", tool, e.what() );
    status = 1;
  }

  delete source;
  curl_global_cleanup();

  return status;
}
