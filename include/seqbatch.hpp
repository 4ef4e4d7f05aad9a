/*
    Alphabet and pipeline constants.
*/

#pragma once

#include <cstdint>

// Library version
#define SEQBATCH_VERSION 3

/*
    Control symbols.

    PAD doubles as the alignment gap symbol, so padded rows read as gapped
    sequences when untokenized.
*/
#define SEQBATCH_PAD '-'
#define SEQBATCH_START '@'
#define SEQBATCH_STOP '*'
#define SEQBATCH_MASK '#'

// Canonical, ambiguous (BZX) and rare (JOU) residues
#define SEQBATCH_ALL_AAS "ACDEFGHIKLMNPQRSTVWYBZXJOU"

// Residues followed by PAD, STOP, MASK, START
#define SEQBATCH_PROTEIN_ALPHABET SEQBATCH_ALL_AAS "-*#@"

// trRosetta ordering: 20 canonical residues and gap
#define SEQBATCH_TRR_ALPHABET "ARNDCQEGHILKMFPSTWYV-"

/*
    Masked-LM corruption policy.

    A fraction of positions is chosen, and each chosen position draws
    p in [0, 1):
        p <= keep                    : leave the residue
        keep < p <= keep + replace   : random different residue
        otherwise                    : MASK
*/
static const double kDefaultMaskFraction = 0.15;
static const double kDefaultKeepFraction = 0.10;
static const double kDefaultReplaceFraction = 0.10;

/*
    Structure feature widths.

    Node features: 5 angles to the previous residue, 5 to the next.
    Edge features: dist, omega, theta fw/bw, phi fw/bw.
*/
static const int kNodeFeatures = 10;
static const int kEdgeFeatures = 6;

static const uint32_t kDefaultConnections = 20;
static const double kDefaultStructureDrop = 0.1;
