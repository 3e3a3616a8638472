/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include "libutil/mybase.h"

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>

#include <string>
#include <vector>
#include <set>
#include <algorithm>

#include "libutil/mygetopt.h"
#include "libutil/CLOptions.h"
#include "libmhc/mdats/PredictionCollection.h"
#include "libmhc/mdats/SequenceReader.h"
#include "libmhc/mtools/ToolPresets.h"
#include "libmhc/mtools/ToolSpec.h"
#include "libmhc/mproc/CmdlinePredictor.h"

#include "mhcbatch.h"

// =========================================================================
// declarations:
//
void SplitString(std::string argstring, std::string option, std::vector<std::string>&, bool sortunique);
int PrintPredictions(const PredictionCollection&, const std::string& outfile);

inline int mystring2int(int& retval, const std::string& strval, const char* errstr)
{
    char* p;
    errno = 0;
    retval = strtol( strval.c_str(), &p, 10 );
    if( errno || *p || strval.empty()) {
        error( errstr );
        return EXIT_FAILURE;
    }
    return 0;
}

// =========================================================================

int main( int argc, char *argv[] )
{
    int c;
    char* p;
    std::string     myoptarg;
    //
    std::vector<std::string> allelelst;//list of alleles
    std::vector<std::string> lengthlst;//list of peptide lengths
    std::vector<std::string> extralst;//list of extra flags
    //
    std::string     toolname;//tool preset
    std::string     program;//path to the tool's executable
    std::string     alleles;//alleles
    std::string     pepfile;//file of peptides
    std::string     fastafile;//file of sequences
    std::string     lengths;//peptide lengths
    std::string     extraflags;//extra flags of the tool
    std::string     outfile;//output file
    //
    std::string     proclimit;//limit on concurrent processes
    std::string     pollinterval;//poll interval
    std::string     maxrecords;//max #records per input file
    bool            capturestderr = 0;//write stderr of the tool to files
    bool            keeptemp = 0;//keep temporary files
    std::string     tmpdir;//directory for temporary files
    std::string     precision;//output precision
    //
    bool            listalleles = 0;//list supported alleles
    bool            listtools = 0;//list tool presets
    std::string     verbose;
    int             verblev = 0;//suppress warnings

    SetArguments( &argc, &argv );
    SetProgramName( argv[0], version );

    if( argc <= 1 ) {
        fprintf( stdout, "%s", usage(argv[0],instructs,version,verdate).c_str());
        return EXIT_SUCCESS;
    }

    enum {
        mbOpt_tool = my_n_targflags,
        mbOpt_program, mbOpt_alleles, mbOpt_peptides, mbOpt_fasta,
        mbOpt_lengths, mbOpt_extra_flags, mbOpt_o,
        //
        mbOpt_process_limit, mbOpt_poll_interval, mbOpt_max_records_per_file,
        mbOpt_capture_stderr, mbOpt_keep_temp, mbOpt_tmpdir,
        //
        mbOpt_precision,
        //
        mbOpt_list_alleles, mbOpt_list_tools, mbOpt_v, mbOpt_h
    };

    static struct myoption long_options[] = {
        {"tool", my_required_argument, mbOpt_tool},
        {"program", my_required_argument, mbOpt_program},
        {"alleles", my_required_argument, mbOpt_alleles},
        {"peptides", my_required_argument, mbOpt_peptides},
        {"fasta", my_required_argument, mbOpt_fasta},
        {"lengths", my_required_argument, mbOpt_lengths},
        {"extra-flags", my_required_argument, mbOpt_extra_flags},
        {"o", my_required_argument, mbOpt_o},
        //
        {"process-limit", my_required_argument, mbOpt_process_limit},
        {"poll-interval", my_required_argument, mbOpt_poll_interval},
        {"max-records-per-file", my_required_argument, mbOpt_max_records_per_file},
        {"capture-stderr", my_no_argument, mbOpt_capture_stderr},
        {"keep-temp", my_no_argument, mbOpt_keep_temp},
        {"tmpdir", my_required_argument, mbOpt_tmpdir},
        //
        {"precision", my_required_argument, mbOpt_precision},
        //
        {"list-alleles", my_no_argument, mbOpt_list_alleles},
        {"list-tools", my_no_argument, mbOpt_list_tools},
        {"v", my_optional_argument, mbOpt_v},
        {"h", my_no_argument, mbOpt_h},
        { NULL, my_n_targflags, 0 }
    };

    TRY
        MyGetopt mygetopt( long_options, (const char**)argv, argc );
        while(( c = mygetopt.GetNextOption( &myoptarg )) >= 0 ) {
            switch( c ) {
                case ':':   fprintf( stdout, "Argument missing. Please try option -h for help.%s", NL );
                            return EXIT_FAILURE;
                case '?':   fprintf( stdout, "Unrecognized option. Please try option -h for help.%s", NL );
                            return EXIT_FAILURE;
                case '!':   fprintf( stdout, "Ill-formed option. Please try option -h for help.%s", NL );
                            return EXIT_FAILURE;
                case '*':   fprintf( stdout, "Unexpected argument %s. Please try option -h for help.%s",
                                mygetopt.GetLastWord(), NL );
                            return EXIT_FAILURE;
                case mbOpt_h: fprintf( stdout, "%s", usage(argv[0],instructs,version,verdate).c_str());
                            return EXIT_SUCCESS;
                //
                case mbOpt_tool:        toolname = myoptarg; break;
                case mbOpt_program:     program = myoptarg; break;
                case mbOpt_alleles:     alleles = myoptarg; break;
                case mbOpt_peptides:    pepfile = myoptarg; break;
                case mbOpt_fasta:       fastafile = myoptarg; break;
                case mbOpt_lengths:     lengths = myoptarg; break;
                case mbOpt_extra_flags: extraflags = myoptarg; break;
                case mbOpt_o:           outfile = myoptarg; break;
                //
                case mbOpt_process_limit:   proclimit = myoptarg; break;
                case mbOpt_poll_interval:   pollinterval = myoptarg; break;
                case mbOpt_max_records_per_file: maxrecords = myoptarg; break;
                case mbOpt_capture_stderr:  capturestderr = 1; break;
                case mbOpt_keep_temp:       keeptemp = 1; break;
                case mbOpt_tmpdir:          tmpdir = myoptarg; break;
                //
                case mbOpt_precision:   precision = myoptarg; break;
                //
                case mbOpt_list_alleles:    listalleles = 1; break;
                case mbOpt_list_tools:      listtools = 1; break;
                case mbOpt_v:           verblev = 1; verbose = myoptarg; break;
                default:    break;
            }
        }
    CATCH_ERROR_RETURN(;);


    if( !verbose.empty()) {
        errno = 0;
        verblev = strtol( verbose.c_str(), &p, 10 );
        if( errno || *p || verblev < 0 ) {
            error( "Invalid verbose mode argument." );
            return EXIT_FAILURE;
        }
    }

    SetVerboseMode( verblev );

    MYMSGBEGl(1)
        progname_and_version( stderr );
        MYMSG(("Command line: " + cmdline_string()).c_str(), 1);
    MYMSGENDl

    //{{list tool presets and exit
    if( listtools ) {
        TRY
            std::vector<std::string> names = GetToolPresetNames();
            for(const std::string& name: names) {
                ToolSpec tool = GetToolPreset(name);
                fprintf(stdout, "%-15s %s%s", name.c_str(), tool.program_.c_str(), NL);
            }
        CATCH_ERROR_RETURN(;);
        return EXIT_SUCCESS;
    }
    //}}


    //{{ COMMAND-LINE OPTIONS
    TRY
        if( toolname.empty()) {
            error("Tool preset should be specified (option --tool).");
            return EXIT_FAILURE;
        }

        if( !listalleles ) {
            if( alleles.empty()) {
                error("Alleles should be specified (option --alleles).");
                return EXIT_FAILURE;
            }
            if( pepfile.empty() == fastafile.empty()) {
                error("Either a file of peptides or a FASTA file should be specified.");
                return EXIT_FAILURE;
            }
            if( !lengths.empty() && fastafile.empty()) {
                error("Option --lengths is valid with option --fasta only.");
                return EXIT_FAILURE;
            }
            SplitString(alleles, "--alleles", allelelst, false);
        }

        if( !lengths.empty())
            SplitString(lengths, "--lengths", lengthlst, true);

        if( !extraflags.empty())
            SplitString(extraflags, "--extra-flags", extralst, false);

        if( !proclimit.empty()) {
            if( mystring2int(c, proclimit, "Invalid argument of option --process-limit."))
                return EXIT_FAILURE;
            if( c < CLOptions::pplAllCPUs ) {
                error("Invalid argument of option --process-limit.");
                return EXIT_FAILURE;
            }
            CLOPTASSIGN(P_PROCESS_LIMIT, c);
        }

        if( !pollinterval.empty()) {
            if( mystring2int(c, pollinterval, "Invalid argument of option --poll-interval."))
                return EXIT_FAILURE;
            CLOPTASSIGN(P_POLL_INTERVAL, c);
        }

        if( !maxrecords.empty()) {
            if( mystring2int(c, maxrecords, "Invalid argument of option --max-records-per-file."))
                return EXIT_FAILURE;
            if( c < 1 ) {
                error("Invalid argument of option --max-records-per-file.");
                return EXIT_FAILURE;
            }
            CLOPTASSIGN(P_MAX_RECORDS, c);
        }

        CLOPTASSIGN(P_CAPTURE_STDERR, capturestderr);
        CLOPTASSIGN(P_KEEP_TEMP, keeptemp);

        if( !tmpdir.empty()) {
            if( !directory_exists(tmpdir.c_str())) {
                error(("Directory does not exist: " + tmpdir).c_str());
                return EXIT_FAILURE;
            }
            CLOPTASSIGN(P_TMPDIR, tmpdir);
        }

        if( !precision.empty()) {
            if( mystring2int(c, precision, "Invalid argument of option --precision."))
                return EXIT_FAILURE;
            CLOPTASSIGN(O_PRECISION, c);
        }
    CATCH_ERROR_RETURN(;);
    //}}


    int ret = EXIT_SUCCESS;

    TRY
        if( toolname == "netmhc")
            toolname = CmdlinePredictor::DetectNetMHCVersion(program.empty()? "netMHC": program);
        else if( toolname == "netmhciipan")
            toolname = CmdlinePredictor::DetectNetMHCIIpanVersion(program.empty()? "netMHCIIpan": program);

        ToolSpec tool = GetToolPreset(toolname);
        if( !program.empty())
            tool.program_ = program;
        tool.extraflags_.insert(tool.extraflags_.end(), extralst.begin(), extralst.end());

        CmdlinePredictor predictor(tool);
        predictor.CheckToolAvailable();

        if( listalleles ) {
            const std::set<std::string>& supported = predictor.SupportedAlleles();
            for(const std::string& allele: supported)
                fprintf(stdout, "%s%s", allele.c_str(), NL);
            return EXIT_SUCCESS;
        }

        predictor.SetAlleles(allelelst);

        std::vector<int> peplengths;
        for(const std::string& len: lengthlst) {
            if( mystring2int(c, len, "Invalid argument of option --lengths."))
                return EXIT_FAILURE;
            peplengths.push_back(c);
        }

        PredictionCollection predictions;

        if( !pepfile.empty())
            predictions = predictor.PredictPeptides(SequenceReader::ReadPeptides(pepfile));
        else
            predictions = predictor.PredictSubsequences(
                SequenceReader::ReadFasta(fastafile), peplengths);

        ret = PrintPredictions(predictions, outfile);

        print_dtime(1);
    CATCH_ERROR_RETURN(;);

    if( ret == EXIT_SUCCESS )
        checkforwarnings();

    return ret;
}

// -------------------------------------------------------------------------
// PrintPredictions: print predictions to the output file or, if it is
// not given, to the standard output
//
int PrintPredictions(const PredictionCollection& predictions, const std::string& outfile)
{
    MYMSG( "Main::PrintPredictions", 3 );
    const int precision = CLOptions::GetO_PRECISION();

    if( outfile.empty()) {
        predictions.Print(stdout, precision);
        fflush(stdout);
        return EXIT_SUCCESS;
    }

    FILE* fp = fopen(outfile.c_str(), "w");
    if( fp == NULL ) {
        error(("Failed to open file for writing: " + outfile).c_str());
        return EXIT_FAILURE;
    }

    myruntime_error mre;
    try {
        predictions.Print(fp, precision);
    } catch( myexception const& ex ) {
        mre = ex;
    }

    if( fclose(fp) != 0 && !mre.isset())
        mre = MYRUNTIME_ERROR("Failed to write file " + outfile);

    if( mre.isset())
        throw mre;

    MYMSG(("Predictions written to " + outfile).c_str(), 1);
    return EXIT_SUCCESS;
}

// -------------------------------------------------------------------------
// SplitString: form a list of values separated by commas and written in 
// one string;
// argstring, input string of values separated by commas;
// option, option name;
// vlist, vector of split values;
// sortunique, sort values and remove duplicates
//
void SplitString(std::string argstring, std::string option, std::vector<std::string>& vlist,
    bool sortunique)
{
    MYMSG( "Main::SplitString", 5 );
    std::string::size_type pos;
    vlist.clear();
    for( pos = argstring.find(','); !argstring.empty(); pos = argstring.find(',')) {
        std::string value = argstring.substr(0, pos);
        if( value.empty())
            throw MYRUNTIME_ERROR2(
            "Invalid value (two commas?) specified by option " + option, CONFIGURATION);
        vlist.push_back(std::move(value));
        if( pos == std::string::npos )
            break;
        argstring = argstring.substr(pos+1);
    }
    if( !sortunique )
        return;
    //remove duplicates
    std::sort(vlist.begin(), vlist.end());
    auto last = std::unique(vlist.begin(), vlist.end());
    vlist.erase(last, vlist.end());
}
