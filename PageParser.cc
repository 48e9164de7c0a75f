/**
 * Class for parsing Page XML documents into ordered pages, regions and lines.
 *
 * @version $Version: 2025.10.17$
 * @copyright Copyright (c) 2016-present, Mauricio Villegas <mauricio_ville@yahoo.com>
 * @license MIT License
 */

#include "PageParser.h"
#include "TextDecoder.h"
#include "WindowSegmenter.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>
#include <ctype.h>
#include <math.h>
#include <limits.h>
#include <regex>
#include <algorithm>
#include <unordered_set>

#include <libxml/xpathInternals.h>
#include <opencv2/core/core.hpp>
#include <unicode/uversion.h>
#include <curl/curl.h>
#if defined (__PAGEDS_ZIP__)
#include <zip.h>
#endif

using namespace std;

const char* PageParser::defaultNamespace = "http://schema.primaresearch.org/PAGE/gts/pagecontent/2013-07-15";

static regex reReadingOrder("readingOrder\\s*\\{\\s*index\\s*:\\s*(\\d+)");


/////////////////////
/// Class version ///
/////////////////////

static char class_version[] = "Version: 2025.10.17";

/**
 * Returns the class version.
 */
char* PageParser::version() {
  return class_version+9;
}

void PageParser::printVersions( FILE* file ) {
  fprintf( file, "compiled against PageParser %s\n", class_version+9 );
  fprintf( file, "compiled against libxml2 %s, linked with %s\n", LIBXML_DOTTED_VERSION, xmlParserVersion );
  fprintf( file, "compiled against opencv %s\n", CV_VERSION );
  fprintf( file, "compiled against icu %s\n", U_ICU_VERSION );
  fprintf( file, "compiled against libcurl %s, linked with %s\n", LIBCURL_VERSION, curl_version() );
#if defined (__PAGEDS_ZIP__)
  fprintf( file, "linked with libzip %s\n", zip_libzip_version() );
#endif
}


/////////////////////////
/// Resources release ///
/////////////////////////

/**
 * Releases the currently loaded XML document.
 */
void PageParser::release() {
  if( context != NULL )
    xmlXPathFreeContext(context);
  context = NULL;
  if( xml != NULL )
    xmlFreeDoc(xml);
  xml = NULL;
  rootnode = NULL;
}

/**
 * PageParser object destructor.
 */
PageParser::~PageParser() {
  release();
}

////////////////////
/// Constructors ///
////////////////////

/**
 * PageParser constructor.
 *
 * @param _pagens  Namespace of the Page XML elements, NULL or empty for the default one.
 */
PageParser::PageParser( const char* _pagens ) {
  pagens = _pagens == NULL || _pagens[0] == '\0' ? defaultNamespace : _pagens;
}


///////////////
/// Loaders ///
///////////////

/**
 * Loads a Page XML from a UTF-8 string and sets up the xpath context.
 *
 * @param xml_string  The XML content.
 * @return            False if the XML is not well formed.
 */
bool PageParser::loadXmlString( const string& xml_string ) {
  release();

  if( xml_string.size() > (size_t)INT_MAX ) {
    fprintf( stderr, "warning: XML parsing error: document too large\n" );
    return false;
  }

  xml = xmlReadMemory( xml_string.data(), (int)xml_string.size(), NULL, "UTF-8", XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING );
  if( ! xml ) {
    const xmlError* error = xmlGetLastError();
    string message = error != NULL && error->message != NULL ? error->message : "unknown error";
    while( ! message.empty() && ( message[message.size()-1] == '\n' || message[message.size()-1] == ' ' ) )
      message.erase( message.size()-1 );
    fprintf( stderr, "warning: XML parsing error: %s\n", message.c_str() );
    return false;
  }

  context = xmlXPathNewContext(xml);
  if( context == NULL ) {
    release();
    throw_runtime_error( "PageParser.loadXmlString: unable create xpath context" );
    return false;
  }
  if( xmlXPathRegisterNs( context, (xmlChar*)"_", (xmlChar*)pagens.c_str() ) != 0 ) {
    release();
    throw_runtime_error( "PageParser.loadXmlString: unable to register namespace" );
    return false;
  }
  rootnode = context->node;

  return true;
}


/////////////////
/// Selectors ///
/////////////////

/**
 * Selects nodes given an xpath.
 *
 * @param xpath     Selector expression.
 * @param basenode  XML node for context, set to NULL for root node.
 * @return          Vector of matched nodes.
 */
vector<xmlNodePt> PageParser::select( const char* xpath, const xmlNodePt basenode ) {
  vector<xmlNodePt> matched;

  if( basenode != NULL )
    context->node = (xmlNodePtr)basenode;
  xmlXPathObjectPtr xsel = xmlXPathEvalExpression( (xmlChar*)xpath, context );
  context->node = rootnode;

  if( xsel == NULL ) {
    throw_runtime_error( "PageParser.select: xpath expression failed: %s", xpath );
    return matched;
  }

  if( ! xmlXPathNodeSetIsEmpty(xsel->nodesetval) )
    for( int n=0; n<xsel->nodesetval->nodeNr; n++ )
      matched.push_back( xsel->nodesetval->nodeTab[n] );
  xmlXPathFreeObject(xsel);

  return matched;
}

/**
 * Selects the n-th node that matches an xpath.
 *
 * @param xpath     Selector expression.
 * @param num       Element number (0-indexed).
 * @param basenode  XML node for context, set to NULL for root node.
 * @return          Matched node, NULL if none.
 */
xmlNodePt PageParser::selectNth( const char* xpath, unsigned num, const xmlNodePt basenode ) {
  vector<xmlNodePt> matches = select( xpath, basenode );
  return matches.size() > num ? matches[num] : NULL;
}

/**
 * Gets an attribute value from an xml node.
 *
 * @param node   XML node.
 * @param name   Attribute name.
 * @return       The value, empty if the attribute is not set.
 */
string PageParser::getAttr( const xmlNodePt node, const char* name ) {
  string value("");
  if( node == NULL )
    return value;

  xmlChar* attr = xmlGetProp( node, (xmlChar*)name );
  if( attr == NULL )
    return value;
  value = string((char*)attr);
  xmlFree(attr);

  return value;
}

/**
 * Retrieves the text of the first TextEquiv/Unicode of a node.
 *
 * @param node   The TextRegion or TextLine node.
 * @param text   The text, possibly empty.
 * @return       False if the node has no TextEquiv/Unicode.
 */
bool PageParser::getTextEquiv( const xmlNodePt node, string& text ) {
  text.clear();
  xmlNodePt unicode = selectNth( "_:TextEquiv/_:Unicode", 0, node );
  if( unicode == NULL )
    return false;

  xmlChar* t = xmlNodeGetContent(unicode);
  if( t != NULL ) {
    text = (char*)t;
    xmlFree(t);
  }
  return true;
}

/**
 * Retrieves and parses the points attribute of a child element.
 *
 * @param node   Base node.
 * @param xpath  Relative selector of the element with the points attribute.
 * @return       The points, empty if there is no element or attribute.
 */
vector<cv::Point> PageParser::getPoints( const xmlNodePt node, const char* xpath ) {
  xmlNodePt coords = selectNth( xpath, 0, node );
  if( coords == NULL )
    return vector<cv::Point>();
  return stringToPoints( getAttr( coords, "points" ) );
}

/**
 * Gets the image URL, from TranskribusMetadata/@imgUrl or else from Page/@imageURL.
 *
 * @param page  The Page node.
 * @param url   The image URL.
 * @return      False if there is no non-empty URL.
 */
bool PageParser::getImageUrl( const xmlNodePt page, string& url ) {
  url = getAttr( selectNth( "//_:TranskribusMetadata" ), "imgUrl" );
  if( url.empty() )
    url = getAttr( page, "imageURL" );
  return ! url.empty();
}

/**
 * Builds the map from region id to reading order index.
 */
unordered_map<string,int> PageParser::getReadingOrder() {
  unordered_map<string,int> order;

  xmlNodePt readingorder = selectNth( "//_:ReadingOrder" );
  if( readingorder == NULL )
    return order;

  vector<xmlNodePt> refs = select( ".//_:RegionRefIndexed", readingorder );
  for( auto&& ref : refs )
    order[getAttr( ref, "regionRef" )] = parseInt( getAttr( ref, "index" ) );

  return order;
}


///////////////
/// Parsing ///
///////////////

/**
 * Parses a string of pairs of coordinates "x1,y1 x2,y2 ...". Tokens that are
 * not a pair of numbers are skipped, decimals are rounded.
 *
 * @param spoints  String containing coordinate pairs.
 * @return         Array of (x,y) coordinates.
 */
vector<cv::Point> PageParser::stringToPoints( const string& spoints ) {
  vector<cv::Point> points;

  const char* p = spoints.c_str();
  while( *p != '\0' ) {
    while( *p != '\0' && isspace((unsigned char)*p) )
      p++;
    const char* start = p;
    while( *p != '\0' && ! isspace((unsigned char)*p) )
      p++;
    if( p == start )
      break;

    string token( start, p-start );
    size_t comma = token.find(',');
    if( comma == string::npos || token.find(',',comma+1) != string::npos )
      continue;

    double xy[2];
    string parts[2] = { token.substr(0,comma), token.substr(comma+1) };
    bool valid = true;
    for( int n=0; n<2 && valid; n++ ) {
      char* end = NULL;
      errno = 0;
      xy[n] = strtod( parts[n].c_str(), &end );
      valid = ! parts[n].empty() && *end == '\0' && errno == 0 && isfinite(xy[n]) && fabs(xy[n]) < INT_MAX;
    }
    if( valid )
      points.push_back( cv::Point( cvRound(xy[0]), cvRound(xy[1]) ) );
  }

  return points;
}

/**
 * Extracts the reading order index from a TextLine custom attribute, e.g. "readingOrder {index:3;}".
 *
 * @param custom  The custom attribute value.
 * @return        The index, 0 if absent or invalid.
 */
int PageParser::getLineReadingOrder( const string& custom ) {
  if( custom.find("readingOrder") == string::npos )
    return 0;

  smatch base_match;
  if( ! regex_search( custom, base_match, reReadingOrder ) )
    return 0;

  try {
    return stoi( base_match[1].str() );
  }
  catch( out_of_range& ) {
    return 0;
  }
}

/**
 * Parses an integer attribute value.
 *
 * @param value  The attribute value, surrounding spaces allowed.
 * @return       The integer, 0 if empty, invalid or out of range.
 */
int PageParser::parseInt( const string& value ) {
  const char* p = value.c_str();
  char* end = NULL;
  errno = 0;
  long num = strtol( p, &end, 10 );
  if( end == p || errno != 0 || num > INT_MAX || num < INT_MIN )
    return 0;
  while( *end != '\0' && isspace((unsigned char)*end) )
    end++;
  return *end == '\0' ? (int)num : 0;
}

/**
 * Parses the TextLine children of a TextRegion, sorted by reading order.
 */
void PageParser::parseLines( const xmlNodePt region, PageRegion& reg ) {
  vector<xmlNodePt> lines = select( "_:TextLine", region );
  for( auto&& node : lines ) {
    PageLine line;
    line.id = getAttr( node, "id" );
    line.coords = getPoints( node );
    if( selectNth( "_:Baseline", 0, node ) != NULL ) {
      line.hasBaseline = true;
      line.baseline = getPoints( node, "_:Baseline" );
    }
    line.hasText = getTextEquiv( node, line.text );
    line.readingOrder = getLineReadingOrder( getAttr( node, "custom" ) );
    line.regionId = reg.id;
    reg.lines.push_back( line );
  }

  stable_sort( reg.lines.begin(), reg.lines.end(),
    []( const PageLine& a, const PageLine& b ) { return a.readingOrder < b.readingOrder; } );
}

/**
 * Parses a single Page XML document.
 *
 * @param xml_string  The XML content in UTF-8.
 * @param project     Name of the project the document belongs to.
 * @param page        The parsed page.
 * @return            False if the XML is invalid or has no Page element.
 */
bool PageParser::parse( const string& xml_string, const string& project, PageData& page ) {
  if( ! loadXmlString( xml_string ) )
    return false;

  xmlNodePt pagenode = selectNth( "/*/_:Page" );
  if( pagenode == NULL ) {
    release();
    return false;
  }

  page = PageData();
  page.imageFilename = getAttr( pagenode, "imageFilename" );
  page.imageWidth = max( 0, parseInt( getAttr( pagenode, "imageWidth" ) ) );
  page.imageHeight = max( 0, parseInt( getAttr( pagenode, "imageHeight" ) ) );
  page.hasImageUrl = getImageUrl( pagenode, page.imageUrl );
  page.xml = xml_string;
  page.project = project;

  unordered_map<string,int> order = getReadingOrder();

  vector<xmlNodePt> regions = select( ".//_:TextRegion", pagenode );
  for( auto&& node : regions ) {
    PageRegion reg;
    reg.id = getAttr( node, "id" );
    if( xmlHasProp( node, (xmlChar*)"type" ) )
      reg.type = getAttr( node, "type" );
    reg.coords = getPoints( node );
    reg.hasText = getTextEquiv( node, reg.text );
    parseLines( node, reg );
    auto it = order.find( reg.id );
    reg.readingOrder = it == order.end() ? 0 : it->second;
    page.regions.push_back( reg );
  }

  stable_sort( page.regions.begin(), page.regions.end(),
    []( const PageRegion& a, const PageRegion& b ) { return a.readingOrder < b.readingOrder; } );

  release();
  return true;
}

/**
 * Parses all Page XML files of a source, grouped by project. Files that can
 * not be read, decoded or parsed are skipped.
 *
 * @param source  The directory or archive.
 * @return        The parsed pages.
 */
vector<PageData> PageParser::parseSource( PageSource& source ) {
  vector<PageData> pages;

  vector<ProjectFiles> projects = source.groupProjects( source.listPageFiles() );
  for( auto&& project : projects ) {
    fprintf( stderr, "Processing project: %s (%d files)\n", project.name.c_str(), (int)project.files.size() );

    for( auto&& file : project.files ) {
      try {
        string raw;
        if( ! source.read( file, raw ) ) {
          fprintf( stderr, "warning: skipping %s due to read error\n", file.c_str() );
          continue;
        }

        string text;
        if( ! TextDecoder::decode( raw, file, text ) ) {
          fprintf( stderr, "warning: skipping %s due to decoding error\n", file.c_str() );
          continue;
        }

        PageData page;
        if( ! parse( text, project.name, page ) ) {
          fprintf( stderr, "warning: skipping %s, not a valid Page XML\n", file.c_str() );
          continue;
        }
        pages.push_back( page );
      }
      catch( const exception& e ) {
        fprintf( stderr, "warning: error parsing %s: %s\n", file.c_str(), e.what() );
      }
    }
  }

  return pages;
}


//////////////////
/// Statistics ///
//////////////////

/**
 * Computes statistics of parsed pages.
 *
 * @param pages        The parsed pages.
 * @param window_size  If greater than zero, also count the windows of this size.
 * @param overlap      Window overlap.
 * @return             The statistics.
 */
PageStats PageParser::getStats( const vector<PageData>& pages, int window_size, int overlap ) {
  PageStats stats;
  unordered_set<string> seen;

  WindowSegmenter* segmenter = window_size > 0 ? new WindowSegmenter( window_size, overlap ) : NULL;

  for( auto&& page : pages ) {
    stats.totalPages++;
    if( seen.insert( page.project ).second )
      stats.projects.push_back( page.project );
    for( auto&& reg : page.regions ) {
      stats.totalRegions++;
      stats.totalLines += reg.lines.size();
      if( segmenter != NULL )
        stats.totalWindows += segmenter->segment( reg.lines.size() ).size();
    }
  }

  delete segmenter;

  if( stats.totalPages > 0 ) {
    stats.avgRegionsPerPage = (double)stats.totalRegions / stats.totalPages;
    stats.avgLinesPerPage = (double)stats.totalLines / stats.totalPages;
  }

  return stats;
}
