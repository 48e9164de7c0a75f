/**
 * Header file for the DatasetWriter class
 *
 * @version $Version: 2025.10.17$
 * @copyright Copyright (c) 2016-present, Mauricio Villegas <mauricio_ville@yahoo.com>
 * @license MIT License
 */

#ifndef __DATASETWRITER_H__
#define __DATASETWRITER_H__

#include <string>
#include <vector>

#include "PageExporter.h"

/**
 * Writes dataset records to a directory: one PNG per record under images/
 * and a dataset.xml manifest with the fields, optionally split in train and test.
 */
class DatasetWriter {
  public:
    static const char* manifestName;
    DatasetWriter( const char* outdir, PAGEDS_EXPORT_MODE mode );
    void add( const DatasetRecord& record );
    int write( double split_train = 0.0, bool shuffle = false, unsigned seed = 42 );
    size_t size() const { return rows.size(); }
    const std::string& getOutputDir() const { return outdir; }
    static void splitSizes( size_t num, double split_train, size_t& num_train, size_t& num_test );
    static void makeDirs( const std::string& path );
  private:
    struct Row {
      std::string image;
      std::vector<RecordField> fields;
    };
    std::string outdir;
    PAGEDS_EXPORT_MODE mode;
    std::vector<std::string> columns;
    std::vector<Row> rows;
};

#endif
