// ---- CONTAINER ----
// SectorStore Documentation
/*
DOCUMENTATION:
CLASS: SectorStore

VARIABLES:
  . static constexpr size_t HEADER_SIZE = 512
      - Size of the compound file header
  . static constexpr array<uint8_t, 8> SIGNATURE
      - D0 CF 11 E0 A1 B1 1A E1
  . static constexpr uint32_t MINI_STREAM_CUTOFF = 4096
      - Streams below this size live in the mini stream
  . vector<uint8_t> image_
      - Owned copy of the whole file, mutated in place by writes
  . ContainerHeader header_
      - Parsed header fields including the 109 header DIFAT entries
  . vector<uint32_t> fat_
      - Allocation table assembled from every FAT sector
  . set<uint32_t> dirty_sectors_
      - Sectors touched by write_at, for diagnostics and tests

CONSTRUCTOR:
  . explicit SectorStore(vector<uint8_t> image)
      - Parses and validates the header
      - Loads the DIFAT chain and the FAT
      - Throws CorruptContainerError on a bad header

METHODS:
Public:
  Chain Operations:
  . SectorChain chain(uint32_t start) const
      - Sector indices from start to END_OF_CHAIN
      - Throws BrokenChainError on cycles, out of range or reserved links
  . vector<uint8_t> read_chain(uint32_t start) const
      - Concatenated payload of the chain
  . void write_chain(uint32_t start, const vector<uint8_t>& data)
      - Overwrites the leading bytes of the chain
      - Throws ChainTooShortError instead of allocating

  Sector Access:
  . vector<uint8_t> read_at(uint32_t sector, size_t offset, size_t length) const
  . void write_at(uint32_t sector, size_t offset, const uint8_t* data, size_t length)
      - Bounds checked, marks the sector dirty

  Output:
  . vector<uint8_t> serialize() const
      - Image with every mutation applied, same size as the input

Private:
  . void load_header() / void validate_header()
  . vector<uint32_t> load_difat() const
      - Header entries followed by the DIFAT sector chain
      - Throws CorruptContainerError on a DIFAT cycle
  . void load_fat(const vector<uint32_t>& fat_sectors)

EXCEPTIONS:
. CorruptContainerError
    - Bad signature, byte order, sector shifts, cutoff or FAT location
. BrokenChainError
    - Chain walk hit a cycle, an index past the end or a reserved marker
. ChainTooShortError
    - Write larger than the chain it targets
*/

// MiniStore Documentation
/*
DOCUMENTATION:
CLASS: MiniStore

VARIABLES:
  . SectorStore& store_
      - Regular sectors backing the mini stream
  . SectorChain container_chain_
      - Regular sectors of the root entry's stream
  . vector<uint32_t> mini_fat_
      - Mini allocation table

CONSTRUCTOR:
  . MiniStore(SectorStore& store, uint32_t root_start, uint64_t root_size)
      - Loads the mini FAT and the root chain
      - Usable mini sectors are the smaller of the declared and the backed count

METHODS:
  . SectorChain chain(uint32_t start) const
  . vector<uint8_t> read_chain(uint32_t start) const
  . void write_chain(uint32_t start, const vector<uint8_t>& data)
      - Same contract as SectorStore, in 64 byte units
  Private:
    . locate(uint32_t mini_sector)
        - Regular sector and offset holding a mini sector
*/

// Directory Documentation
/*
DOCUMENTATION:
CLASS: Directory

VARIABLES:
  . static constexpr size_t ENTRY_SIZE = 128
  . SectorStore& store_
  . vector<DirectoryEntry> entries_
      - Every slot of the directory chain, in id order

CONSTRUCTOR:
  . explicit Directory(SectorStore& store)
      - Parses every 128 byte entry
      - Throws MissingRootError unless entry 0 is the root

METHODS:
  . StreamHandle find_stream(const vector<string>& path)
      - Walks storages from the root, comparing names case-insensitively
      - Throws StreamNotFoundError when a component is missing or of the wrong type
      - Sibling cycles are skipped, out of range ids throw CorruptContainerError
  . const vector<DirectoryEntry>& entries() const
  . const DirectoryEntry& root() const

CLASS: StreamHandle

METHODS:
  . vector<uint8_t> read() const
      - Exactly size() bytes, from the mini stream when below the cutoff
  . void write(const vector<uint8_t>& data)
      - In place, data may not exceed size()
  . bool in_mini_stream() const
*/


// ---- PROJECT ----
// DataEncryption Documentation
/*
DOCUMENTATION:
CLASS: DataEncryption

VARIABLES:
  . static constexpr uint8_t VERSION = 2
  . static constexpr size_t MIN_ENCRYPTED_SIZE = 8

METHODS:
  . static EncryptedBlob decrypt(const vector<uint8_t>& encrypted)
      - Recovers seed, key, ignored bytes and data
      - Throws UnrecognizedSchemeError for another version
      - Throws MalformedRecordError when short or the length disagrees
  . static vector<uint8_t> encrypt(const EncryptedBlob& blob)
      - Exact inverse of decrypt for the same blob
  . static size_t ignored_length(uint8_t seed)
      - (seed & 6) >> 1
*/

// ProtectionRecord Documentation
/*
DOCUMENTATION:
CLASS: ProtectionRecord

VARIABLES:
  . uint32_t protection_bits_
      - USER_PROTECTED 0x1, HOST_PROTECTED 0x2, VBE_PROTECTED 0x4
  . bool visible_
  . PasswordScheme scheme_
      - LegacyPassword (terminated check value) or ModernPassword (salt and SHA-1 digest)
  . optional<RecordLayout> layout_
      - Original stream text and field positions, only set by decode

METHODS:
  . ProtectionState state() const
      - Protected when the VBE bit is set
  . void set_unprotected()
      - Clears VBE and user bits, host bit kept
  . optional<string> plaintext_password() const
      - Legacy check value without its terminator

CLASS: ProtectionRecordCodec

METHODS:
  . static ProtectionRecord decode(const vector<uint8_t>& stream)
      - Finds CMG, DPB and GC lines and decrypts each
      - Throws MalformedRecordError on missing, duplicate or invalid fields
  . static vector<uint8_t> encode(const ProtectionRecord& record)
      - Re-encrypts with the original seeds, every other byte untouched
      - Throws MalformedRecordError when the length would change
  . static PasswordScheme decode_password(const vector<uint8_t>& data)
  . static vector<uint8_t> encode_password(const PasswordScheme& scheme)
      - Null coding through grbitKey and grbitHashNull
*/


// ---- CRYPTO ----
// DigestContext Documentation
/*
DOCUMENTATION:
CLASS: DigestContext (RAII Wrapper)

VARIABLES:
  . EVP_MD_CTX* ctx
      - OpenSSL digest context pointer
      - Initialized to nullptr

CONSTRUCTOR:
  . DigestContext()
      - Creates new EVP digest context
      - Throws DigestError if context creation fails

METHODS:
  . ~DigestContext()
      - Destructor that frees the digest context
  . EVP_MD_CTX* get()
      - Returns the underlying digest context pointer
*/

// HashEngine Documentation
/*
DOCUMENTATION:
CLASS: HashEngine

VARIABLES:
  . static constexpr size_t SHA1_SIZE = 20
  . unique_ptr<DigestContext> context_
      - One context per engine, engines are not shared between threads

METHODS:
  . vector<uint8_t> digest_for(SchemeKind scheme, const vector<uint8_t>& salt,
                               const string& password, optional<uint32_t> rounds)
      - Legacy: password bytes and a 0x00 terminator, throws SaltError when salted
      - Modern: SHA1(password || salt) then rounds of SHA1(H || LE32(i))
  . bool matches(const ProtectionRecord& record, const string& password)
  . vector<uint8_t> sha1(const vector<uint8_t>& data)
      - Throws DigestError when OpenSSL fails
*/

// Cracker Documentation
/*
DOCUMENTATION:
CLASS: Cracker

VARIABLES:
  . size_t worker_count_
      - At least 1

METHODS:
  . optional<string> crack(const ProtectionRecord& record, const vector<string>& candidates) const
      - First matching candidate in list order
      - Workers take interleaved indices and share the lowest match found
      - A worker exception is rethrown on the calling thread

CLASS: WorkerGroup

VARIABLES:
  . vector<thread> threads_

METHODS:
  . void spawn(Func&& func)
  . void join()
      - Joins every joinable thread, repeatable
  . ~WorkerGroup()
      - Joins, so a throw between spawns never leaves a running thread behind
*/


// ---- UNLOCK ----
// Inspector / Patcher Documentation
/*
DOCUMENTATION:
CLASS: Inspector

METHODS:
  . static ProjectReport inspect(const vector<uint8_t>& container_bytes, const vector<string>& stream_path,
                                 const vector<string>* candidates, size_t workers)
      - Decodes the PROJECT stream, cracks Modern digests when candidates are given
  . static ProjectReport inspect(..., const CandidateSource& candidates, size_t workers)
      - Same, the source is only called for a Modern record
  . static ProjectReport report_for(const ProtectionRecord& record)

CLASS: Patcher

METHODS:
  . static vector<uint8_t> remove_protection(const vector<uint8_t>& container_bytes,
                                             const vector<string>& stream_path)
      - Returns the input untouched when the project is not protected
      - Otherwise rewrites the PROJECT stream in place, nothing else changes
*/


// ---- WORKBOOK ----
// ZipArchive Documentation
/*
DOCUMENTATION:
CLASS: ZipArchive

VARIABLES:
  . vector<uint8_t> bytes_
      - The whole package
  . vector<ZipEntry> entries_
      - Central directory records in directory order
  . size_t end_record_offset_ / central_offset_

CONSTRUCTOR:
  . explicit ZipArchive(vector<uint8_t> bytes)
      - Scans back over at most a 64 KiB comment for the end record
      - Throws ZipArchiveError for zip64, multi-disk or damaged directories

METHODS:
  . bool contains(const string& name) const
  . vector<uint8_t> read(const string& name) const
      - Stored or raw deflate through zlib, size and CRC-32 checked
      - Throws ZipArchiveError when missing, encrypted or corrupt
  . vector<uint8_t> replace(const string& name, const vector<uint8_t>& data) const
      - Recompresses one entry with its own method, other records copied verbatim
      - Offsets in the central directory and end record are recomputed
      - Unchanged data returns the original bytes

FREE FUNCTIONS:
  . project_container(kind, file_bytes) / with_project_container(kind, file_bytes, container)
      - xl/vbaProject.bin out of and back into a package, identity otherwise
*/


// ---- STORE ----
// FileStore Documentation
/*
DOCUMENTATION:
CLASS: FileStore

METHODS:
Public:
  Core Storage Operations:
  . static vector<uint8_t> load(const filesystem::path& path)
      - Reads the whole file in binary chunks
      - Throws FileStoreError if missing or unreadable
  . static void save(const filesystem::path& path, const vector<uint8_t>& data)
      - Writes <path>.tmp then renames it over path
      - Removes the staging file on failure

  Query Operations:
  . static filesystem::path unlocked_path(const filesystem::path& path)
      - <stem>_unlocked<ext> beside the input

CLASS: Wordlist

METHODS:
  . static Wordlist load(const filesystem::path& path)
      - One trimmed candidate per non-empty line, in file order
  . static Wordlist from(vector<string> candidates)
*/


// ---- CLI ----
// CLI Documentation
/*
DOCUMENTATION:
CLASS: CLI

VARIABLES:
  . ostream& out_
      - Report and confirmation output
  . ostream& err_
      - Error messages

METHODS:
  . bool handle_read_command(const ReadOptions& options)
      - Loads the file, detects its kind, prints the protection report
      - Extracts the project from .xlsm/.xlsb packages
      - Loads the wordlist and cracks when decode is set and the password is hashed
  . bool handle_remove_command(const RemoveOptions& options)
      - Writes the patched copy to <name>_unlocked or over the input
      - Packages get their xl/vbaProject.bin entry replaced
  . void print_report(const ProjectReport& report)

  Private:
    . bool guarded(const string& message, Command&& command)
        - Converts exceptions into a logged and displayed error, returns false
*/
