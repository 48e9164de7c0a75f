/**
 * Helpers shared by the unit tests
 *
 * @version $Version: 2025.10.17$
 * @copyright Copyright (c) 2016-present, Mauricio Villegas <mauricio_ville@yahoo.com>
 * @license MIT License
 */

#ifndef __TESTUTILS_H__
#define __TESTUTILS_H__

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <ftw.h>
#include <sys/stat.h>
#include <string>
#include <vector>
#include <map>
#include <stdexcept>

#include <opencv2/core/core.hpp>
#include <opencv2/imgcodecs/imgcodecs.hpp>

#include "PageSource.h"

/**
 * Source with the files held in memory, listed in insertion order.
 */
class MemorySource : public PageSource {
  public:
    int reads = 0;
    void add( const std::string& path, const std::string& bytes ) {
      if( files.find( path ) == files.end() )
        order.push_back( path );
      files[path] = bytes;
    }
    std::string name() { return "memory"; }
    std::vector<std::string> list() { return order; }
    bool exists( const std::string& path ) { return files.find( path ) != files.end(); }
    bool read( const std::string& path, std::string& bytes ) {
      reads++;
      auto it = files.find( path );
      if( it == files.end() )
        return false;
      bytes = it->second;
      return true;
    }
  private:
    std::vector<std::string> order;
    std::map<std::string,std::string> files;
};

inline std::string encodeImage( const cv::Mat& image, const char* ext = ".png" ) {
  std::vector<uchar> buffer;
  cv::imencode( ext, image, buffer );
  return std::string( buffer.begin(), buffer.end() );
}

inline std::string makeTempDir() {
  char tmpl[] = "/tmp/pageds_test_XXXXXX";
  if( mkdtemp( tmpl ) == NULL )
    throw std::runtime_error( "unable to create temporary directory" );
  return tmpl;
}

inline void makeDir( const std::string& path ) {
  mkdir( path.c_str(), 0755 );
}

inline void writeFile( const std::string& path, const std::string& content ) {
  FILE* file = fopen( path.c_str(), "wb" );
  if( file == NULL )
    throw std::runtime_error( "unable to write "+path );
  fwrite( content.data(), 1, content.size(), file );
  fclose( file );
}

inline std::string readFile( const std::string& path ) {
  std::string content;
  FILE* file = fopen( path.c_str(), "rb" );
  if( file == NULL )
    return content;
  char buffer[4096];
  size_t num;
  while( ( num = fread( buffer, 1, sizeof buffer, file ) ) > 0 )
    content.append( buffer, num );
  fclose( file );
  return content;
}

inline int removeEntry( const char* path, const struct stat*, int, struct FTW* ) {
  return remove( path );
}

inline void removeTree( const std::string& path ) {
  nftw( path.c_str(), removeEntry, 16, FTW_DEPTH | FTW_PHYS );
}

#endif
