/**
 * Header file for the sources of Page XML files and images
 *
 * @version $Version: 2025.10.17$
 * @copyright Copyright (c) 2016-present, Mauricio Villegas <mauricio_ville@yahoo.com>
 * @license MIT License
 */

#ifndef __PAGESOURCE_H__
#define __PAGESOURCE_H__

#include <string>
#include <vector>
#include <unordered_set>

#if defined (__PAGEDS_ZIP__)
#include <zip.h>
#endif

struct ProjectFiles {
  std::string name;
  std::vector<std::string> files;
};

/**
 * Base class for a tree of files addressed by '/' separated relative paths.
 */
class PageSource {
  public:
    virtual ~PageSource() {};
    static PageSource* open( const char* path );
    virtual std::string name() = 0;
    virtual std::vector<std::string> list() = 0;
    virtual bool exists( const std::string& path ) = 0;
    virtual bool read( const std::string& path, std::string& bytes ) = 0;
    virtual std::string groupingPath( const std::string& path );
    virtual bool locate( const std::vector<std::string>& candidates, const std::string& filename, std::string& found );
    std::vector<std::string> listPageFiles();
    std::vector<ProjectFiles> groupProjects( const std::vector<std::string>& paths );
    static std::string baseName( const std::string& path );
    static std::vector<std::string> splitPath( const std::string& path );
    static bool isXmlFile( const std::string& path );
    static bool isMetadataFile( const std::string& path );
    static bool isSystemFile( const std::string& path );
    static std::string getProjectName( const std::string& path );
};

class DirectorySource : public PageSource {
  public:
    DirectorySource( const char* dir );
    std::string name();
    std::vector<std::string> list();
    bool exists( const std::string& path );
    bool read( const std::string& path, std::string& bytes );
    std::string groupingPath( const std::string& path );
  private:
    std::string dir;
    std::string dirName;
    void listDir( const std::string& rel, std::vector<std::string>& files );
};

#if defined (__PAGEDS_ZIP__)

class ZipSource : public PageSource {
  public:
    ZipSource( const char* fname );
    ~ZipSource();
    ZipSource( const ZipSource& ) = delete;
    ZipSource& operator=( const ZipSource& ) = delete;
    std::string name();
    std::vector<std::string> list();
    bool exists( const std::string& path );
    bool read( const std::string& path, std::string& bytes );
    bool locate( const std::vector<std::string>& candidates, const std::string& filename, std::string& found );
  private:
    std::string fname;
    zip_t* archive = NULL;
    std::vector<std::string> entries;
    std::unordered_set<std::string> entrySet;
};

#endif

#endif
