#pragma once

#include <streambuf>
#include <ostream>
#include <string>
#include "ImportResult.h"
#include "ItemStatistics.h"
#include "ToleranceSolver.h"

namespace measanalyzer
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Used to write the analyzer log to the console and to the log file at
 * the same time.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Write the file, record and failure counts of one import
 * @param out Destination stream
 * @param result Result of the import
 */
void printImportSummary(std::ostream& out, const mkc_measurement::ImportResult& result);

/**
 * @brief Write one line per item with count, NG count, mean, sd and CPK
 */
void printItemStatistics(std::ostream& out,
                         const std::string& itemName,
                         const mkc_measurement::ItemStatistics& statistics);

/**
 * @brief Write a tolerance suggestion with its supporting values
 */
void printToleranceSuggestion(std::ostream& out,
                              const std::string& itemName,
                              const mkc_measurement::ToleranceSuggestion& suggestion);

} // namespace utils
} // namespace measanalyzer
