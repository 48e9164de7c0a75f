/**
 * Unit tests for the PageParser class
 *
 * @version $Version: 2025.10.17$
 * @copyright Copyright (c) 2016-present, Mauricio Villegas <mauricio_ville@yahoo.com>
 * @license MIT License
 */

#include <gtest/gtest.h>

#include "PageParser.h"
#include "TextDecoder.h"
#include "TestUtils.h"

using namespace std;

static const char samplePage[] =
  "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
  "<PcGts xmlns=\"http://schema.primaresearch.org/PAGE/gts/pagecontent/2013-07-15\">\n"
  "  <Metadata>\n"
  "    <Creator>test</Creator>\n"
  "    <TranskribusMetadata docId=\"1\" imgUrl=\"https://files.example.org/image?id=7\"/>\n"
  "  </Metadata>\n"
  "  <Page imageFilename=\"0001.jpg\" imageWidth=\"200\" imageHeight=\"100\" imageURL=\"https://other.example.org/0001.jpg\">\n"
  "    <ReadingOrder>\n"
  "      <OrderedGroup id=\"ro_1\">\n"
  "        <RegionRefIndexed index=\"0\" regionRef=\"r2\"/>\n"
  "        <RegionRefIndexed index=\"1\" regionRef=\"r1\"/>\n"
  "      </OrderedGroup>\n"
  "    </ReadingOrder>\n"
  "    <TextRegion id=\"r1\" type=\"heading\" custom=\"readingOrder {index:1;}\">\n"
  "      <Coords points=\"10,10 100,10 100,40 10,40\"/>\n"
  "      <TextLine id=\"l2\" custom=\"readingOrder {index:1;}\">\n"
  "        <Coords points=\"10,25 100,25 100,40 10,40\"/>\n"
  "        <Baseline points=\"10,38 100,38\"/>\n"
  "        <TextEquiv><Unicode>second</Unicode></TextEquiv>\n"
  "      </TextLine>\n"
  "      <TextLine id=\"l1\" custom=\"readingOrder {index:0;}\">\n"
  "        <Coords points=\"10,10 100,10 100,24 10,24\"/>\n"
  "        <TextEquiv><Unicode>first &amp; foremost</Unicode></TextEquiv>\n"
  "      </TextLine>\n"
  "      <TextEquiv><Unicode>first &amp; foremost\nsecond</Unicode></TextEquiv>\n"
  "    </TextRegion>\n"
  "    <TextRegion id=\"r2\">\n"
  "      <Coords points=\"10,50 100,50 100,90 10,90\"/>\n"
  "      <TextLine id=\"l3\">\n"
  "        <Coords points=\"10,50 100,50 100,90 10,90\"/>\n"
  "      </TextLine>\n"
  "      <TextEquiv><Unicode></Unicode></TextEquiv>\n"
  "    </TextRegion>\n"
  "    <TextRegion id=\"r3\" type=\"marginalia\">\n"
  "      <Coords points=\"150,10 190,10 190,90\"/>\n"
  "    </TextRegion>\n"
  "  </Page>\n"
  "</PcGts>\n";

static string minimalPage( const char* ns, const char* regions ) {
  return string("<PcGts xmlns=\"")+ns+"\"><Page imageFilename=\"x.png\" imageWidth=\"10\" imageHeight=\"10\">"+regions+"</Page></PcGts>";
}

TEST(PageParser, PageAttributes) {
  PageParser parser;
  PageData page;
  ASSERT_TRUE( parser.parse( samplePage, "proj", page ) );
  EXPECT_EQ( "0001.jpg", page.imageFilename );
  EXPECT_EQ( 200, page.imageWidth );
  EXPECT_EQ( 100, page.imageHeight );
  EXPECT_TRUE( page.hasImageUrl );
  EXPECT_EQ( "https://files.example.org/image?id=7", page.imageUrl );
  EXPECT_EQ( "proj", page.project );
  EXPECT_EQ( samplePage, page.xml );
}

TEST(PageParser, RegionsInReadingOrder) {
  PageParser parser;
  PageData page;
  ASSERT_TRUE( parser.parse( samplePage, "proj", page ) );
  ASSERT_EQ( 3u, page.regions.size() );

  EXPECT_EQ( "r2", page.regions[0].id );
  EXPECT_EQ( "paragraph", page.regions[0].type );
  EXPECT_EQ( 0, page.regions[0].readingOrder );

  /// r3 is not in the reading order table, gets 0 and keeps document order ///
  EXPECT_EQ( "r3", page.regions[1].id );
  EXPECT_EQ( "marginalia", page.regions[1].type );
  EXPECT_EQ( 0, page.regions[1].readingOrder );

  EXPECT_EQ( "r1", page.regions[2].id );
  EXPECT_EQ( "heading", page.regions[2].type );
  EXPECT_EQ( 1, page.regions[2].readingOrder );
  vector<cv::Point> coords = { cv::Point(10,10), cv::Point(100,10), cv::Point(100,40), cv::Point(10,40) };
  EXPECT_EQ( coords, page.regions[2].coords );
}

TEST(PageParser, LinesInReadingOrder) {
  PageParser parser;
  PageData page;
  ASSERT_TRUE( parser.parse( samplePage, "proj", page ) );
  const PageRegion& reg = page.regions[2];
  ASSERT_EQ( 2u, reg.lines.size() );

  EXPECT_EQ( "l1", reg.lines[0].id );
  EXPECT_EQ( 0, reg.lines[0].readingOrder );
  EXPECT_TRUE( reg.lines[0].hasText );
  EXPECT_EQ( "first & foremost", reg.lines[0].text );
  EXPECT_FALSE( reg.lines[0].hasBaseline );

  EXPECT_EQ( "l2", reg.lines[1].id );
  EXPECT_EQ( 1, reg.lines[1].readingOrder );
  EXPECT_EQ( "second", reg.lines[1].text );
  ASSERT_TRUE( reg.lines[1].hasBaseline );
  vector<cv::Point> baseline = { cv::Point(10,38), cv::Point(100,38) };
  EXPECT_EQ( baseline, reg.lines[1].baseline );

  for( auto&& line : reg.lines )
    EXPECT_EQ( reg.id, line.regionId );
}

TEST(PageParser, RegionTextPresence) {
  PageParser parser;
  PageData page;
  ASSERT_TRUE( parser.parse( samplePage, "proj", page ) );

  /// Own TextEquiv, not concatenated from the lines ///
  EXPECT_TRUE( page.regions[2].hasText );
  EXPECT_EQ( "first & foremost\nsecond", page.regions[2].text );

  /// Present but empty ///
  EXPECT_TRUE( page.regions[0].hasText );
  EXPECT_EQ( "", page.regions[0].text );
  EXPECT_FALSE( page.regions[0].lines[0].hasText );

  /// Absent ///
  EXPECT_FALSE( page.regions[1].hasText );
  EXPECT_TRUE( page.regions[1].lines.empty() );
}

TEST(PageParser, LinesWithoutOrderKeepDocumentOrder) {
  string xml = minimalPage( PageParser::defaultNamespace,
    "<TextRegion id=\"r\"><Coords points=\"0,0 5,0 5,5\"/>"
    "<TextLine id=\"c\" custom=\"structure {type:x;}\"><Coords points=\"0,0 1,1\"/></TextLine>"
    "<TextLine id=\"a\"><Coords points=\"0,0 1,1\"/></TextLine>"
    "<TextLine id=\"z\" custom=\"readingOrder {index:0;}\"><Coords points=\"0,0 1,1\"/></TextLine>"
    "<TextLine id=\"b\"><Coords points=\"0,0 1,1\"/></TextLine>"
    "</TextRegion>" );
  PageParser parser;
  PageData page;
  ASSERT_TRUE( parser.parse( xml, "p", page ) );
  ASSERT_EQ( 1u, page.regions.size() );
  vector<string> ids;
  for( auto&& line : page.regions[0].lines )
    ids.push_back( line.id );
  EXPECT_EQ( vector<string>({ "c", "a", "z", "b" }), ids );
}

TEST(PageParser, MissingAttributes) {
  string xml = minimalPage( PageParser::defaultNamespace, "<TextRegion><TextLine/></TextRegion>" );
  xml.replace( xml.find( "imageWidth=\"10\"" ), 15, "imageWidth=\"-5\"" );
  xml.replace( xml.find( "imageHeight=\"10\"" ), 16, "imageHeight=\"abc\"" );
  PageParser parser;
  PageData page;
  ASSERT_TRUE( parser.parse( xml, "p", page ) );
  EXPECT_EQ( 0, page.imageWidth );
  EXPECT_EQ( 0, page.imageHeight );
  EXPECT_FALSE( page.hasImageUrl );
  ASSERT_EQ( 1u, page.regions.size() );
  EXPECT_EQ( "", page.regions[0].id );
  EXPECT_TRUE( page.regions[0].coords.empty() );
  ASSERT_EQ( 1u, page.regions[0].lines.size() );
  EXPECT_TRUE( page.regions[0].lines[0].coords.empty() );
  EXPECT_FALSE( page.regions[0].lines[0].hasBaseline );
}

TEST(PageParser, ImageUrlFromPage) {
  string xml = minimalPage( PageParser::defaultNamespace, "" );
  xml.replace( xml.find( "<Page " ), 6, "<Page imageURL=\"http://host/x.png\" " );
  PageParser parser;
  PageData page;
  ASSERT_TRUE( parser.parse( xml, "p", page ) );
  EXPECT_TRUE( page.hasImageUrl );
  EXPECT_EQ( "http://host/x.png", page.imageUrl );
}

TEST(PageParser, NestedRegionsFound) {
  string xml = minimalPage( PageParser::defaultNamespace,
    "<TableRegion id=\"t\"><TableCell id=\"c\"><TextRegion id=\"inner\"/></TableCell></TableRegion>" );
  PageParser parser;
  PageData page;
  ASSERT_TRUE( parser.parse( xml, "p", page ) );
  ASSERT_EQ( 1u, page.regions.size() );
  EXPECT_EQ( "inner", page.regions[0].id );
}

TEST(PageParser, CustomNamespace) {
  const char ns[] = "http://schema.primaresearch.org/PAGE/gts/pagecontent/2019-07-15";
  string xml = minimalPage( ns, "<TextRegion id=\"r\"/>" );

  PageParser defaultParser;
  PageData page;
  EXPECT_FALSE( defaultParser.parse( xml, "p", page ) );

  PageParser parser( ns );
  EXPECT_EQ( ns, parser.getNamespace() );
  ASSERT_TRUE( parser.parse( xml, "p", page ) );
  EXPECT_EQ( 1u, page.regions.size() );

  PageParser emptyParser( "" );
  EXPECT_EQ( PageParser::defaultNamespace, emptyParser.getNamespace() );
}

TEST(PageParser, InvalidDocuments) {
  PageParser parser;
  PageData page;
  EXPECT_FALSE( parser.parse( "<PcGts><Page", "p", page ) );
  EXPECT_FALSE( parser.parse( "", "p", page ) );
  EXPECT_FALSE( parser.parse( string("<PcGts xmlns=\"")+PageParser::defaultNamespace+"\"><Wrapper><Page/></Wrapper></PcGts>", "p", page ) );
  EXPECT_FALSE( parser.parse( "<PcGts xmlns=\"http://schema.primaresearch.org/PAGE/gts/pagecontent/2013-07-15\"/>", "p", page ) );

  /// Parser usable after failures ///
  EXPECT_TRUE( parser.parse( samplePage, "proj", page ) );
}

TEST(PageParser, StringToPoints) {
  vector<cv::Point> expected = { cv::Point(1,2), cv::Point(4,4), cv::Point(8,9), cv::Point(-3,0) };
  EXPECT_EQ( expected, PageParser::stringToPoints( " 1,2  3.6,4.4 bad 5,6,7 ,3 8,9 x,1 -3,0 " ) );
  EXPECT_TRUE( PageParser::stringToPoints( "" ).empty() );
}

TEST(PageParser, LineReadingOrder) {
  EXPECT_EQ( 12, PageParser::getLineReadingOrder( "readingOrder {index:12;} structure {type:heading;}" ) );
  EXPECT_EQ( 3, PageParser::getLineReadingOrder( "structure {type:x;} readingOrder { index : 3 ;}" ) );
  EXPECT_EQ( 0, PageParser::getLineReadingOrder( "" ) );
  EXPECT_EQ( 0, PageParser::getLineReadingOrder( "readingOrder {index:abc;}" ) );
  EXPECT_EQ( 0, PageParser::getLineReadingOrder( "readingOrder {index:99999999999999999999;}" ) );
}

TEST(PageParser, ParseInt) {
  EXPECT_EQ( 12, PageParser::parseInt( "12" ) );
  EXPECT_EQ( 12, PageParser::parseInt( " 12 " ) );
  EXPECT_EQ( -5, PageParser::parseInt( "-5" ) );
  EXPECT_EQ( 0, PageParser::parseInt( "12px" ) );
  EXPECT_EQ( 0, PageParser::parseInt( "" ) );
}

TEST(PageParser, Stats) {
  PageParser parser;
  vector<PageData> pages(2);
  ASSERT_TRUE( parser.parse( samplePage, "a", pages[0] ) );
  ASSERT_TRUE( parser.parse( samplePage, "b", pages[1] ) );

  PageStats stats = PageParser::getStats( pages, 2, 1 );
  EXPECT_EQ( 2, stats.totalPages );
  EXPECT_EQ( 6, stats.totalRegions );
  EXPECT_EQ( 6, stats.totalLines );
  EXPECT_EQ( vector<string>({ "a", "b" }), stats.projects );
  EXPECT_DOUBLE_EQ( 3.0, stats.avgRegionsPerPage );
  EXPECT_DOUBLE_EQ( 3.0, stats.avgLinesPerPage );
  /// r1 has 2 lines -> 1 window, r2 has 1 line -> 1 window, r3 none ///
  EXPECT_EQ( 4, stats.totalWindows );

  PageStats empty = PageParser::getStats( vector<PageData>() );
  EXPECT_EQ( 0, empty.totalPages );
  EXPECT_DOUBLE_EQ( 0.0, empty.avgLinesPerPage );
}

TEST(PageParser, ParseSource) {
  string tmp = makeTempDir();
  makeDir( tmp+"/proj" );
  makeDir( tmp+"/proj/page" );
  writeFile( tmp+"/proj/page/0001.xml", samplePage );
  writeFile( tmp+"/proj/page/0002.xml", "<PcGts><broken" );
  writeFile( tmp+"/proj/page/0003.xml", string("<PcGts xmlns=\"")+PageParser::defaultNamespace+"\"><Page imageFilename=\"caf\xE9.png\"/></PcGts>" );
  writeFile( tmp+"/proj/mets.xml", "<mets/>" );

  DirectorySource source( tmp.c_str() );
  PageParser parser;
  vector<PageData> pages = parser.parseSource( source );
  removeTree( tmp );

  ASSERT_EQ( 2u, pages.size() );
  EXPECT_EQ( "proj", pages[0].project );
  EXPECT_EQ( 3u, pages[0].regions.size() );
  EXPECT_EQ( "proj", pages[1].project );
  EXPECT_EQ( 0u, pages[1].imageFilename.find( "caf" ) );
  EXPECT_TRUE( TextDecoder::isUtf8( pages[1].imageFilename ) );
  EXPECT_NE( "caf\xE9.png", pages[1].imageFilename );
}
