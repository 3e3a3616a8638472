/***************************************************************************
 *   Copyright (C) 2021-2023 by Mindaugas Margelevicius                    *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __mhcbatch_h__
#define __mhcbatch_h__

static const char*  version = "0.1.00";
static const char*  verdate = "";

static const char*  instructs = "\n\
<> []\n\
\n\
mhcbatch, batch MHC binding predictions by external command-line tools.\n\
(C)2021-2023 Mindaugas Margelevicius, Institute of Biotechnology, Vilnius University\n\
\n\
\n\
Usage (one of the two):\n\
<> --tool=<preset> --alleles=<alleles> --peptides=<file> [<options>]\n\
<> --tool=<preset> --alleles=<alleles> --fasta=<file> [--lengths=<lengths>] [<options>]\n\
\n\
Basic options:\n\
--tool=<preset>             Tool preset (see --list-tools). netmhc selects\n\
                            netmhc3 or netmhc4 by the help output of netMHC;\n\
                            netmhciipan selects netmhciipan3 or netmhciipan4\n\
                            by the help output of netMHCIIpan.\n\
--program=<path>            Path to the tool's executable.\n\
                        Default=program name of the preset (found in PATH)\n\
--alleles=<allele_list>     Comma-separated list of MHC alleles, e.g.,\n\
                            HLA-A*02:01,HLA-B*07:02.\n\
--peptides=<file>           File of peptides, one per line.\n\
--fasta=<file>              File of sequences in FASTA format. Predictions\n\
                            are made for all their subsequences of the given\n\
                            lengths.\n\
--lengths=<length_list>     Comma-separated list of peptide lengths for\n\
                            --fasta.\n\
                        Default=lengths of the preset\n\
--extra-flags=<flag_list>   Comma-separated list of flags appended to every\n\
                            command of the tool.\n\
-o <output_file>            Output file of predictions.\n\
                        Default=standard output\n\
\n\
Process options:\n\
--process-limit=<count>     Maximum number of tool processes run at once:\n\
                            0, no limit; -1, number of CPUs.\n\
                        Default=limit of the preset\n\
--poll-interval=<ms>        Interval between checks for finished processes\n\
                            when the limit is reached [1,60000].\n\
                        Default=1000\n\
--max-records-per-file=<count>\n\
                            Maximum number of sequences or peptides in one\n\
                            input file of the tool.\n\
                        Default=10000\n\
--capture-stderr            Write error streams of the tool to files beside\n\
                            its outputs.\n\
--keep-temp                 Do not remove temporary files.\n\
--tmpdir=<directory>        Directory for temporary files.\n\
                        Default=$TMPDIR or /tmp\n\
\n\
Output options:\n\
--precision=<digits>        Number of decimal digits of values [0,12].\n\
                        Default=4\n\
\n\
Other options:\n\
--list-alleles              List alleles supported by the tool and exit.\n\
--list-tools                List tool presets and exit.\n\
-v [<level_number>]         Verbose mode.\n\
-h                          This text.\n\
\n\
\n\
Examples:\n\
<> --tool=netmhccons --alleles=HLA-A*02:01 --peptides=peptides.txt\n\
<> --tool=netmhcpan4 --alleles=HLA-A*02:01,HLA-B*07:02 --fasta=proteins.fa --lengths=8,9,10 -o out.tsv\n\
\n\
";

#endif//__mhcbatch_h__
