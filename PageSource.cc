/**
 * Sources of Page XML files and images: directory trees and zip archives.
 *
 * @version $Version: 2025.10.17$
 * @copyright Copyright (c) 2016-present, Mauricio Villegas <mauricio_ville@yahoo.com>
 * @license MIT License
 */

#include "PageSource.h"
#include "PageModel.h"

#include <stdio.h>
#include <stdlib.h>
#include <limits.h>
#include <string.h>
#include <ctype.h>
#include <dirent.h>
#include <sys/stat.h>
#include <algorithm>
#include <unordered_map>

using namespace std;

static const char* metadataNames[] = {
  "mets.xml",
  "metadata.xml"
};


////////////////////
/// Path helpers ///
////////////////////

/**
 * Splits a '/' separated path into its non-empty components.
 */
vector<string> PageSource::splitPath( const string& path ) {
  vector<string> parts;
  size_t start = 0;
  while( start <= path.size() ) {
    size_t slash = path.find( '/', start );
    if( slash == string::npos )
      slash = path.size();
    if( slash > start )
      parts.push_back( path.substr(start,slash-start) );
    start = slash+1;
  }
  return parts;
}

string PageSource::baseName( const string& path ) {
  size_t slash_pos = path.find_last_of("/");
  return slash_pos == string::npos ? path : path.substr(slash_pos+1);
}

bool PageSource::isXmlFile( const string& path ) {
  return path.size() >= 4 && path.compare( path.size()-4, 4, ".xml" ) == 0;
}

/**
 * Checks whether the file is a platform metadata file (mets.xml, metadata.xml).
 */
bool PageSource::isMetadataFile( const string& path ) {
  string base = baseName( path );
  for( size_t n=0; n<base.size(); n++ )
    base[n] = tolower( (unsigned char)base[n] );
  int names = sizeof(metadataNames) / sizeof(metadataNames[0]);
  for( int n=0; n<names; n++ )
    if( base == metadataNames[n] )
      return true;
  return false;
}

/**
 * Checks whether the file is hidden or generated by the operating system, e.g. macOS resource forks.
 */
bool PageSource::isSystemFile( const string& path ) {
  vector<string> parts = splitPath( path );
  for( auto&& part : parts )
    if( part == "__MACOSX" )
      return true;
  for( auto&& part : parts )
    if( part[0] == '.' )
      return true;
  return false;
}

/**
 * Infers the project of a file: the directory containing the "page"
 * directory, otherwise the parent directory, otherwise the path itself.
 *
 * @param path  '/' separated file path.
 * @return      The project name.
 */
string PageSource::getProjectName( const string& path ) {
  vector<string> parts = splitPath( path );
  if( parts.size() == 0 )
    return path;
  for( size_t n=0; n<parts.size(); n++ )
    if( parts[n] == "page" ) {
      if( n > 0 )
        return parts[n-1];
      break;
    }
  if( parts.size() >= 2 )
    return parts[parts.size()-2];
  return parts[0];
}


////////////////////
/// Base source  ///
////////////////////

/**
 * Opens a directory or a zip file as a source.
 *
 * @param path  Path to a directory or zip file.
 * @return      Pointer to the new source, to be deleted by the caller.
 */
PageSource* PageSource::open( const char* path ) {
  struct stat st;
  if( stat( path, &st ) != 0 ) {
    throw_runtime_error( "PageSource.open: source path does not exist: %s", path );
    return NULL;
  }
  if( S_ISDIR(st.st_mode) )
    return new DirectorySource( path );
#if defined (__PAGEDS_ZIP__)
  return new ZipSource( path );
#else
  throw_runtime_error( "PageSource.open: compiled without zip support, unable to read: %s", path );
  return NULL;
#endif
}

/**
 * Path used to infer the project of a file.
 */
string PageSource::groupingPath( const string& path ) {
  return path;
}

/**
 * Finds the first candidate path that exists in the source.
 *
 * @param candidates  Paths to check in order.
 * @param filename    The image filename declared in the XML.
 * @param found       The matching path.
 * @return            True if found, otherwise false.
 */
bool PageSource::locate( const vector<string>& candidates, const string& filename, string& found ) {
  if( filename.empty() )
    return false;
  for( auto&& path : candidates )
    if( exists( path ) ) {
      found = path;
      return true;
    }
  return false;
}

/**
 * Lists the candidate Page XML files, skipping metadata and system files.
 */
vector<string> PageSource::listPageFiles() {
  vector<string> files;
  for( auto&& path : list() )
    if( isXmlFile( path ) && ! isMetadataFile( path ) && ! isSystemFile( path ) )
      files.push_back( path );
  return files;
}

/**
 * Groups files by project, keeping the order of first appearance.
 *
 * @param paths  Files of the source.
 * @return       Vector of projects with their files.
 */
vector<ProjectFiles> PageSource::groupProjects( const vector<string>& paths ) {
  vector<ProjectFiles> projects;
  unordered_map<string,size_t> index;
  for( auto&& path : paths ) {
    string project = getProjectName( groupingPath( path ) );
    auto it = index.find( project );
    if( it == index.end() ) {
      index[project] = projects.size();
      projects.push_back( ProjectFiles() );
      projects.back().name = project;
      projects.back().files.push_back( path );
    }
    else
      projects[it->second].files.push_back( path );
  }
  return projects;
}


////////////////////////
/// Directory source ///
////////////////////////

DirectorySource::DirectorySource( const char* _dir ) {
  dir = _dir;
  while( dir.size() > 1 && dir[dir.size()-1] == '/' )
    dir.erase( dir.size()-1 );

  char resolved[PATH_MAX];
  if( realpath( dir.c_str(), resolved ) == NULL ) {
    throw_runtime_error( "DirectorySource: unable to resolve directory: %s", _dir );
    return;
  }
  dirName = baseName( resolved );
}

string DirectorySource::name() {
  return dir;
}

void DirectorySource::listDir( const string& rel, vector<string>& files ) {
  string full = rel.empty() ? dir : dir+'/'+rel;
  DIR* dp = opendir( full.c_str() );
  if( dp == NULL ) {
    fprintf( stderr, "warning: unable to list directory: %s\n", full.c_str() );
    return;
  }

  vector<string> names;
  struct dirent* entry;
  while( ( entry = readdir(dp) ) != NULL )
    if( strcmp(entry->d_name,".") && strcmp(entry->d_name,"..") )
      names.push_back( entry->d_name );
  closedir(dp);
  sort( names.begin(), names.end() );

  for( auto&& name : names ) {
    string path = rel.empty() ? name : rel+'/'+name;
    struct stat st;
    if( lstat( (dir+'/'+path).c_str(), &st ) != 0 )
      continue;
    if( S_ISDIR(st.st_mode) )
      listDir( path, files );
    else if( S_ISREG(st.st_mode) )
      files.push_back( path );
    /// Symbolic links are followed only to regular files ///
    else if( S_ISLNK(st.st_mode) &&
             stat( (dir+'/'+path).c_str(), &st ) == 0 && S_ISREG(st.st_mode) )
      files.push_back( path );
  }
}

/**
 * Recursively lists the regular files, relative to the directory and sorted.
 * Symbolic links to directories are not descended into.
 */
vector<string> DirectorySource::list() {
  vector<string> files;
  listDir( "", files );
  return files;
}

bool DirectorySource::exists( const string& path ) {
  struct stat st;
  return stat( (dir+'/'+path).c_str(), &st ) == 0 && S_ISREG(st.st_mode);
}

bool DirectorySource::read( const string& path, string& bytes ) {
  string full = dir+'/'+path;
  FILE *file;
  if( (file=fopen(full.c_str(),"rb")) == NULL ) {
    fprintf( stderr, "warning: error reading %s: unable to open file\n", full.c_str() );
    return false;
  }

  bytes.clear();
  char buffer[65536];
  size_t num;
  while( ( num = fread( buffer, 1, sizeof buffer, file ) ) > 0 )
    bytes.append( buffer, num );
  bool failed = ferror(file);
  fclose(file);

  if( failed ) {
    fprintf( stderr, "warning: error reading %s: read failed\n", full.c_str() );
    return false;
  }
  return true;
}

/**
 * The directory's own name is included so that files at the top level get it as project.
 */
string DirectorySource::groupingPath( const string& path ) {
  return dirName+'/'+path;
}


//////////////////
/// Zip source ///
//////////////////

#if defined (__PAGEDS_ZIP__)

ZipSource::ZipSource( const char* _fname ) {
  fname = _fname;
  int error = 0;
  archive = zip_open( _fname, ZIP_RDONLY, &error );
  if( archive == NULL ) {
    zip_error_t zerror;
    zip_error_init_with_code( &zerror, error );
    string message = zip_error_strerror( &zerror );
    zip_error_fini( &zerror );
    throw_runtime_error( "ZipSource: unable to open archive %s: %s", _fname, message.c_str() );
    return;
  }

  zip_int64_t num = zip_get_num_entries( archive, 0 );
  for( zip_int64_t n=0; n<num; n++ ) {
    const char* entry = zip_get_name( archive, n, 0 );
    if( entry == NULL || entry[0] == '\0' || entry[strlen(entry)-1] == '/' )
      continue;
    entries.push_back( entry );
    entrySet.insert( entry );
  }
}

ZipSource::~ZipSource() {
  if( archive != NULL )
    zip_discard( archive );
  archive = NULL;
}

string ZipSource::name() {
  return fname;
}

/**
 * Lists the file entries in archive order.
 */
vector<string> ZipSource::list() {
  return entries;
}

bool ZipSource::exists( const string& path ) {
  return entrySet.find( path ) != entrySet.end();
}

bool ZipSource::read( const string& path, string& bytes ) {
  zip_stat_t st;
  zip_stat_init( &st );
  if( zip_stat( archive, path.c_str(), 0, &st ) != 0 || ! (st.valid & ZIP_STAT_SIZE) ) {
    fprintf( stderr, "warning: error reading %s: %s\n", path.c_str(), zip_strerror(archive) );
    return false;
  }

  zip_file_t* file = zip_fopen( archive, path.c_str(), 0 );
  if( file == NULL ) {
    fprintf( stderr, "warning: error reading %s: %s\n", path.c_str(), zip_strerror(archive) );
    return false;
  }

  bytes.resize( st.size );
  zip_int64_t num = st.size > 0 ? zip_fread( file, &bytes[0], st.size ) : 0;
  zip_fclose( file );

  if( num < 0 || (zip_uint64_t)num != st.size ) {
    fprintf( stderr, "warning: error reading %s: truncated entry\n", path.c_str() );
    return false;
  }
  return true;
}

/**
 * Besides the candidate paths, accepts any entry that ends with the image filename.
 */
bool ZipSource::locate( const vector<string>& candidates, const string& filename, string& found ) {
  if( PageSource::locate( candidates, filename, found ) )
    return true;
  if( filename.empty() )
    return false;
  for( auto&& entry : entries )
    if( entry.size() >= filename.size() &&
        entry.compare( entry.size()-filename.size(), filename.size(), filename ) == 0 ) {
      found = entry;
      return true;
    }
  return false;
}

#endif
