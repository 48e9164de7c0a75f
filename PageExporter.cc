/**
 * Assembly of dataset records from parsed pages for each export mode.
 *
 * @version $Version: 2025.10.17$
 * @copyright Copyright (c) 2016-present, Mauricio Villegas <mauricio_ville@yahoo.com>
 * @license MIT License
 */

#include "PageExporter.h"
#include "PageGeometry.h"

#include <string.h>

using namespace std;

const char* PageExporter::modeNames[] = {
  "raw",
  "text",
  "region",
  "line",
  "window"
};

static const char* rawColumns[] = { "xml", "filename", "project" };
static const char* textColumns[] = { "text", "filename", "project" };
static const char* regionColumns[] = { "text", "region_type", "region_id", "reading_order", "filename", "project" };
static const char* lineColumns[] = { "text", "line_id", "line_reading_order", "region_id", "region_reading_order", "region_type", "filename", "project" };
static const char* windowColumns[] = { "text", "window_size", "window_index", "line_ids", "line_reading_orders", "region_id", "region_reading_order", "region_type", "filename", "project" };

#define COLUMNS( list ) vector<string>( list, list+sizeof(list)/sizeof(list[0]) )


//////////////////////
/// Dataset record ///
//////////////////////

void DatasetRecord::clear() {
  image.release();
  fields.clear();
}

void DatasetRecord::set( const char* name, const string& value ) {
  RecordField field;
  field.name = name;
  field.value = value;
  fields.push_back( field );
}

void DatasetRecord::set( const char* name, int value ) {
  set( name, to_string(value) );
}

void DatasetRecord::setNull( const char* name ) {
  RecordField field;
  field.name = name;
  field.null = true;
  fields.push_back( field );
}

/**
 * Gets a field by name, NULL if the record does not have it.
 */
const RecordField* DatasetRecord::get( const string& name ) const {
  for( auto&& field : fields )
    if( field.name == name )
      return &field;
  return NULL;
}


///////////////////
/// Export mode ///
///////////////////

/**
 * Parses an export mode name, "raw_xml" being accepted for "raw".
 *
 * @param mode  The mode name.
 * @return      The PAGEDS_EXPORT_MODE value, -1 if unknown.
 */
int PageExporter::parseMode( const char* mode ) {
  if( ! strcmp( mode, "raw_xml" ) )
    return PAGEDS_EXPORT_RAW;
  int modes = sizeof(modeNames) / sizeof(modeNames[0]);
  for( int n=0; n<modes; n++ )
    if( ! strcmp( modeNames[n], mode ) )
      return n;
  return -1;
}

/**
 * Names of the fields of the records of a mode, the image excluded.
 */
vector<string> PageExporter::columns( PAGEDS_EXPORT_MODE mode ) {
  switch( mode ) {
    case PAGEDS_EXPORT_RAW:    return COLUMNS( rawColumns );
    case PAGEDS_EXPORT_TEXT:   return COLUMNS( textColumns );
    case PAGEDS_EXPORT_REGION: return COLUMNS( regionColumns );
    case PAGEDS_EXPORT_LINE:   return COLUMNS( lineColumns );
    case PAGEDS_EXPORT_WINDOW: return COLUMNS( windowColumns );
  }
  return vector<string>();
}


///////////////////
/// Constructor ///
///////////////////

/**
 * PageExporter constructor.
 *
 * @param pages   Parsed pages, must outlive the exporter.
 * @param loader  Image loader, must outlive the exporter.
 * @param config  Export configuration.
 * @throws        std::invalid_argument for an invalid window configuration.
 */
PageExporter::PageExporter( const vector<PageData>& pages, ImageLoader& loader, const ExportConfig& config ) :
  pages(pages), loader(loader), config(config),
  segmenter( config.mode == PAGEDS_EXPORT_WINDOW ? config.windowSize : 1,
             config.mode == PAGEDS_EXPORT_WINDOW ? config.overlap : 0 ) {
  if( config.mode == PAGEDS_EXPORT_WINDOW )
    fprintf( stderr, "Exporting windows of %d lines with overlap %d\n", config.windowSize, config.overlap );
  else
    fprintf( stderr, "Exporting %s records from %d pages\n", modeNames[config.mode], (int)pages.size() );
}


/////////////////////
/// Page handling ///
/////////////////////

/**
 * Loads the image of the current page, skipping pages whose image is not
 * found or fails to load.
 *
 * @return  False if there are no more pages.
 */
bool PageExporter::loadPage() {
  while( pagenum < pages.size() ) {
    const PageData& page = pages[pagenum];
    string origin, error;
    PAGEDS_IMAGE status = loader.load( page, image, origin, error );
    if( status == PAGEDS_IMAGE_OK ) {
      regnum = linenum = winnum = 0;
      windows.clear();
      pageReady = true;
      return true;
    }

    skipped++;
    if( status == PAGEDS_IMAGE_NOT_FOUND )
      fprintf( stderr, "warning: no image found for %s in project %s\n", page.imageFilename.c_str(), page.project.c_str() );
    else
      failedImages.push_back( make_pair( origin, error ) );
    pagenum++;
  }
  return false;
}

void PageExporter::finishPage() {
  image.release();
  pageReady = false;
  pagenum++;
}

/**
 * Crops an element of the current page, counting the failures as skipped.
 */
bool PageExporter::cropElement( const vector<cv::Point>& coords, int min_width, const string& id, cv::Mat& cropped ) {
  PAGEDS_CROP status = PageGeometry::crop( image, coords, config.mask, min_width, cropped );
  if( status == PAGEDS_CROP_OK )
    return true;

  skipped++;
  fprintf( stderr, "warning: skipping %s of %s: %s\n", id.c_str(), pages[pagenum].imageFilename.c_str(), PageGeometry::cropStatusNames[status] );
  return false;
}


//////////////////////
/// Record streams ///
//////////////////////

/**
 * Gets the next record. Page images are loaded only when needed.
 *
 * @param record  The record.
 * @return        False when there are no more records.
 */
bool PageExporter::next( DatasetRecord& record ) {
  record.clear();
  switch( config.mode ) {
    case PAGEDS_EXPORT_RAW:
    case PAGEDS_EXPORT_TEXT:
      return nextPage( record );
    case PAGEDS_EXPORT_REGION:
      return nextRegion( record );
    case PAGEDS_EXPORT_LINE:
      return nextLine( record );
    case PAGEDS_EXPORT_WINDOW:
      return nextWindow( record );
  }
  return false;
}

/**
 * Full page records, with either the XML or the region texts joined in reading order.
 */
bool PageExporter::nextPage( DatasetRecord& record ) {
  if( ! loadPage() )
    return false;

  const PageData& page = pages[pagenum];
  record.image = image;
  if( config.mode == PAGEDS_EXPORT_RAW )
    record.set( "xml", page.xml );
  else {
    string text;
    for( auto&& reg : page.regions )
      if( reg.hasText && ! reg.text.empty() )
        text += ( text.empty() ? "" : "\n" ) + reg.text;
    record.set( "text", text );
  }
  record.set( "filename", page.imageFilename );
  record.set( "project", page.project );

  finishPage();
  processed++;
  return true;
}

bool PageExporter::nextRegion( DatasetRecord& record ) {
  while( pageReady || loadPage() ) {
    const PageData& page = pages[pagenum];
    while( regnum < page.regions.size() ) {
      const PageRegion& reg = page.regions[regnum++];
      if( ( ! reg.hasText || reg.text.empty() ) && ! config.allowEmpty ) {
        skipped++;
        fprintf( stderr, "warning: skipping region %s of %s: no text\n", reg.id.c_str(), page.imageFilename.c_str() );
        continue;
      }

      cv::Mat cropped;
      if( ! cropElement( reg.coords, config.minWidth, reg.id, cropped ) )
        continue;

      record.image = cropped;
      if( reg.hasText )
        record.set( "text", reg.text );
      else
        record.setNull( "text" );
      record.set( "region_type", reg.type );
      record.set( "region_id", reg.id );
      record.set( "reading_order", reg.readingOrder );
      record.set( "filename", page.imageFilename );
      record.set( "project", page.project );
      processed++;
      return true;
    }
    finishPage();
  }
  return false;
}

bool PageExporter::nextLine( DatasetRecord& record ) {
  while( pageReady || loadPage() ) {
    const PageData& page = pages[pagenum];
    while( regnum < page.regions.size() ) {
      const PageRegion& reg = page.regions[regnum];
      while( linenum < reg.lines.size() ) {
        const PageLine& line = reg.lines[linenum++];
        if( ( ! line.hasText || line.text.empty() ) && ! config.allowEmpty ) {
          skipped++;
          fprintf( stderr, "warning: skipping line %s of %s: no text\n", line.id.c_str(), page.imageFilename.c_str() );
          continue;
        }

        cv::Mat cropped;
        if( ! cropElement( line.coords, config.minWidth, line.id, cropped ) )
          continue;

        record.image = cropped;
        record.set( "text", line.hasText ? line.text : string("") );
        record.set( "line_id", line.id );
        record.set( "line_reading_order", line.readingOrder );
        record.set( "region_id", line.regionId );
        record.set( "region_reading_order", reg.readingOrder );
        record.set( "region_type", reg.type );
        record.set( "filename", page.imageFilename );
        record.set( "project", page.project );
        processed++;
        return true;
      }
      regnum++;
      linenum = 0;
    }
    finishPage();
  }
  return false;
}

/**
 * Records of consecutive lines, cropped at the bounding box of the lines.
 */
bool PageExporter::nextWindow( DatasetRecord& record ) {
  while( pageReady || loadPage() ) {
    const PageData& page = pages[pagenum];
    while( regnum < page.regions.size() ) {
      const PageRegion& reg = page.regions[regnum];
      if( winnum == 0 )
        windows = segmenter.segment( reg.lines.size() );

      while( winnum < windows.size() ) {
        const LineWindow window = windows[winnum];
        int index = (int)winnum++;

        vector<vector<cv::Point> > polys;
        string text, line_ids, line_orders;
        for( size_t n=window.start; n<window.start+window.size; n++ ) {
          const PageLine& line = reg.lines[n];
          if( line.coords.size() > 0 )
            polys.push_back( line.coords );
          if( line.hasText && ! line.text.empty() )
            text += ( text.empty() ? "" : "\n" ) + line.text;
          line_ids += ( n == window.start ? "" : ", " ) + line.id;
          line_orders += ( n == window.start ? "" : ", " ) + to_string(line.readingOrder);
        }

        string id = reg.id+" window "+to_string(index);
        if( polys.size() == 0 ) {
          skipped++;
          fprintf( stderr, "warning: skipping %s of %s: no line coordinates\n", id.c_str(), page.imageFilename.c_str() );
          continue;
        }

        vector<cv::Point> bbox;
        PageGeometry::pointsBBox( polys, bbox );
        cv::Mat cropped;
        if( ! cropElement( bbox, 0, id, cropped ) )
          continue;

        record.image = cropped;
        record.set( "text", text );
        record.set( "window_size", (int)window.size );
        record.set( "window_index", index );
        record.set( "line_ids", line_ids );
        record.set( "line_reading_orders", line_orders );
        record.set( "region_id", reg.id );
        record.set( "region_reading_order", reg.readingOrder );
        record.set( "region_type", reg.type );
        record.set( "filename", page.imageFilename );
        record.set( "project", page.project );
        processed++;
        return true;
      }
      regnum++;
      winnum = 0;
    }
    finishPage();
  }
  return false;
}


///////////////
/// Summary ///
///////////////

/**
 * Prints the processed and skipped counts and the first failed images.
 */
void PageExporter::printSummary( FILE* file ) const {
  fprintf( file, "############################################################\n" );
  fprintf( file, "Processing Summary:\n" );
  fprintf( file, "  Successfully processed: %d\n", processed );
  fprintf( file, "  Skipped due to errors: %d\n", skipped );
  if( failedImages.size() > 0 ) {
    fprintf( file, "  Failed images:\n" );
    for( size_t n=0; n<failedImages.size() && n<5; n++ )
      fprintf( file, "    %s: %s\n", failedImages[n].first.c_str(), failedImages[n].second.c_str() );
    if( failedImages.size() > 5 )
      fprintf( file, "    ... and %d more\n", (int)failedImages.size()-5 );
  }
}
