/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __TableParser_h__
#define __TableParser_h__

#include "libutil/mybase.h"

#include <map>
#include <string>
#include <vector>

#include "libmhc/mdats/PredictionRecord.h"
#include "libmhc/mtools/ParserSpec.h"

// _________________________________________________________________________
// Class TableParser
//
// parser of the whitespace-delimited tables produced by the tools;
// malformed rows are dropped
//
class TableParser
{
public:
    TableParser(
        const ParserSpec& spec,
        const std::string& toolname,
        const std::string& method,
        const std::map<std::string,std::string>* keymap,
        bool withkeys );

    std::vector<PredictionRecord> Parse( const std::string& text ) const;
    std::vector<PredictionRecord> ParseFile( const std::string& filename ) const;

    size_t GetNDropped() const { return ndropped_; }

    static bool IsHeaderLine( const std::string& line );
    static std::vector<std::string> Tokenize( const std::string& line );

protected:
    void ScanForError( const std::string& text ) const;
    bool CleanFields( const std::vector<std::string>& tokens, std::vector<std::string>* fields ) const;
    bool ParseRow( const std::string& line, std::vector<PredictionRecord>& records ) const;
    std::string ResolveKey( const std::string& shortkey ) const;

private:
    const ParserSpec spec_;//output format
    const std::string toolname_;//tool name for error messages
    const std::string method_;//prediction method name of records
    const std::map<std::string,std::string>* keymap_;//short key -> original key
    const bool withkeys_;//records carry source sequence keys
    mutable size_t ndropped_;//number of rows dropped
};

#endif//__TableParser_h__
