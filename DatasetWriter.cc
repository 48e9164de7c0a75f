/**
 * Local dataset output: PNG images and an XML manifest.
 *
 * @version $Version: 2025.10.17$
 * @copyright Copyright (c) 2016-present, Mauricio Villegas <mauricio_ville@yahoo.com>
 * @license MIT License
 */

#include "DatasetWriter.h"

#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <math.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <algorithm>
#include <numeric>
#include <random>

#include <libxml/tree.h>
#include <opencv2/imgcodecs/imgcodecs.hpp>

using namespace std;

const char* DatasetWriter::manifestName = "dataset.xml";

/**
 * Creates a directory and its missing parents.
 */
void DatasetWriter::makeDirs( const string& path ) {
  size_t pos = 0;
  while( pos != string::npos ) {
    pos = path.find( '/', pos+1 );
    string dir = path.substr( 0, pos );
    if( dir.empty() )
      continue;
    if( mkdir( dir.c_str(), 0755 ) != 0 && errno != EEXIST ) {
      throw_runtime_error( "DatasetWriter: unable to create directory %s: %s", dir.c_str(), strerror(errno) );
    }
  }

  struct stat st;
  if( stat( path.c_str(), &st ) != 0 || ! S_ISDIR(st.st_mode) ) {
    throw_runtime_error( "DatasetWriter: not a directory: %s", path.c_str() );
  }
}

/**
 * DatasetWriter constructor, creates the output directory.
 *
 * @param outdir  Output directory.
 * @param mode    Export mode of the records, defines the columns.
 */
DatasetWriter::DatasetWriter( const char* outdir, PAGEDS_EXPORT_MODE mode ) {
  this->outdir = outdir;
  while( this->outdir.size() > 1 && this->outdir[this->outdir.size()-1] == '/' )
    this->outdir.erase( this->outdir.size()-1 );
  this->mode = mode;
  columns = PageExporter::columns( mode );
  makeDirs( this->outdir+"/images" );
}

/**
 * Saves the image of a record and keeps its fields for the manifest.
 *
 * @param record  The record.
 */
void DatasetWriter::add( const DatasetRecord& record ) {
  char fname[32];
  snprintf( fname, sizeof fname, "images/%08d.png", (int)rows.size() );

  string path = outdir+'/'+fname;
  bool written = false;
  try {
    written = cv::imwrite( path, record.image );
  }
  catch( const cv::Exception& e ) {
    throw_runtime_error( "DatasetWriter.add: problems writing image %s: %s", path.c_str(), e.what() );
  }
  if( ! written ) {
    throw_runtime_error( "DatasetWriter.add: problems writing image %s", path.c_str() );
  }

  Row row;
  row.image = fname;
  for( auto&& column : columns ) {
    const RecordField* field = record.get( column );
    if( field != NULL )
      row.fields.push_back( *field );
    else {
      RecordField missing;
      missing.name = column;
      missing.null = true;
      row.fields.push_back( missing );
    }
  }
  rows.push_back( row );
}

/**
 * Computes the sizes of a train/test split, the test size rounded up.
 *
 * @param num          Number of records.
 * @param split_train  Train ratio, outside (0,1) for no split.
 * @param num_train    Number of train records.
 * @param num_test     Number of test records.
 */
void DatasetWriter::splitSizes( size_t num, double split_train, size_t& num_train, size_t& num_test ) {
  if( split_train <= 0.0 || split_train >= 1.0 ) {
    num_train = num;
    num_test = 0;
    return;
  }
  num_test = (size_t)ceil( (1.0-split_train)*num - 1e-9 );
  if( num_test > num )
    num_test = num;
  num_train = num-num_test;
}

/**
 * Writes the manifest.
 *
 * @param split_train  Train ratio in (0,1), otherwise a single train split.
 * @param shuffle      Whether to shuffle the records before splitting.
 * @param seed         Seed of the shuffle.
 * @return             Number of bytes written.
 */
int DatasetWriter::write( double split_train, bool shuffle, unsigned seed ) {
  vector<size_t> order( rows.size() );
  iota( order.begin(), order.end(), 0 );
  if( shuffle ) {
    mt19937 rng( seed );
    std::shuffle( order.begin(), order.end(), rng );
  }

  size_t num_train, num_test;
  splitSizes( rows.size(), split_train, num_train, num_test );
  bool split = split_train > 0.0 && split_train < 1.0;

  xmlDocPtr doc = xmlNewDoc( (xmlChar*)"1.0" );
  xmlNodePtr root = xmlNewDocNode( doc, NULL, (xmlChar*)"Dataset", NULL );
  xmlDocSetRootElement( doc, root );
  xmlNewProp( root, (xmlChar*)"mode", (xmlChar*)PageExporter::modeNames[mode] );
  xmlNewProp( root, (xmlChar*)"records", (xmlChar*)to_string(rows.size()).c_str() );

  const char* splitNames[] = { "train", "test" };
  size_t bounds[] = { 0, num_train, num_train+num_test };
  for( int s=0; s<( split ? 2 : 1 ); s++ ) {
    xmlNodePtr xsplit = xmlNewChild( root, NULL, (xmlChar*)"Split", NULL );
    xmlNewProp( xsplit, (xmlChar*)"name", (xmlChar*)splitNames[s] );
    xmlNewProp( xsplit, (xmlChar*)"records", (xmlChar*)to_string(bounds[s+1]-bounds[s]).c_str() );

    for( size_t n=bounds[s]; n<bounds[s+1]; n++ ) {
      const Row& row = rows[order[n]];
      xmlNodePtr xrecord = xmlNewChild( xsplit, NULL, (xmlChar*)"Record", NULL );
      xmlNewProp( xrecord, (xmlChar*)"image", (xmlChar*)row.image.c_str() );
      for( auto&& field : row.fields ) {
        xmlNodePtr xfield;
        if( field.null ) {
          xfield = xmlNewChild( xrecord, NULL, (xmlChar*)"Field", NULL );
          xmlNewProp( xfield, (xmlChar*)"name", (xmlChar*)field.name.c_str() );
          xmlNewProp( xfield, (xmlChar*)"null", (xmlChar*)"true" );
        }
        else {
          xfield = xmlNewTextChild( xrecord, NULL, (xmlChar*)"Field", (xmlChar*)field.value.c_str() );
          xmlNewProp( xfield, (xmlChar*)"name", (xmlChar*)field.name.c_str() );
        }
      }
    }
  }

  string path = outdir+'/'+manifestName;
  int bytes = xmlSaveFormatFileEnc( path.c_str(), doc, "utf-8", 1 );
  xmlFreeDoc( doc );
  if( bytes < 0 ) {
    throw_runtime_error( "DatasetWriter.write: problems writing %s", path.c_str() );
  }

  return bytes;
}
