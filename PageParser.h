/**
 * Header file for the PageParser class
 *
 * @version $Version: 2025.10.17$
 * @copyright Copyright (c) 2016-present, Mauricio Villegas <mauricio_ville@yahoo.com>
 * @license MIT License
 */

#ifndef __PAGEPARSER_H__
#define __PAGEPARSER_H__

#include <string>
#include <vector>
#include <unordered_map>

#include <libxml/parser.h>
#include <libxml/xpath.h>

#include "PageModel.h"
#include "PageSource.h"

#define xmlNodePt xmlNode*

struct PageStats {
  int totalPages = 0;
  int totalRegions = 0;
  int totalLines = 0;
  int totalWindows = 0;
  std::vector<std::string> projects;
  double avgRegionsPerPage = 0.0;
  double avgLinesPerPage = 0.0;
};

class PageParser {
  public:
    static const char* defaultNamespace;
    static char* version();
    static void printVersions( FILE* file = stdout );
    ~PageParser();
    PageParser( const char* pagens = NULL );
    PageParser( const PageParser& ) = delete;
    PageParser& operator=( const PageParser& ) = delete;
    const std::string& getNamespace() const { return pagens; }
    bool parse( const std::string& xml_string, const std::string& project, PageData& page );
    std::vector<PageData> parseSource( PageSource& source );
    static PageStats getStats( const std::vector<PageData>& pages, int window_size = 0, int overlap = 0 );
    static std::vector<cv::Point> stringToPoints( const std::string& spoints );
    static int getLineReadingOrder( const std::string& custom );
    static int parseInt( const std::string& value );
  private:
    std::string pagens;
    xmlDocPtr xml = NULL;
    xmlXPathContextPtr context = NULL;
    xmlNodePt rootnode = NULL;
    void release();
    bool loadXmlString( const std::string& xml_string );
    std::vector<xmlNodePt> select( const char* xpath, const xmlNodePt basenode = NULL );
    xmlNodePt selectNth( const char* xpath, unsigned num = 0, const xmlNodePt basenode = NULL );
    std::string getAttr( const xmlNodePt node, const char* name );
    bool getTextEquiv( const xmlNodePt node, std::string& text );
    std::vector<cv::Point> getPoints( const xmlNodePt node, const char* xpath = "_:Coords" );
    bool getImageUrl( const xmlNodePt page, std::string& url );
    std::unordered_map<std::string,int> getReadingOrder();
    void parseLines( const xmlNodePt region, PageRegion& reg );
};

#endif
