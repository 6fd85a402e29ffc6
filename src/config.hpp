#pragma once

/*defaults for editor options and index tuning; override with -D at build time*/

#ifndef TC_DEFAULT_TABSTOP
#define TC_DEFAULT_TABSTOP 4
#endif

#ifndef TC_MAX_TABSTOP
#define TC_MAX_TABSTOP 9999
#endif

#ifndef TC_DEFAULT_EXPANDTAB
#define TC_DEFAULT_EXPANDTAB 0
#endif

/*line starts per block in LineIndex*/
#ifndef TC_LINE_BLOCK_SIZE
#define TC_LINE_BLOCK_SIZE 1024
#endif

#ifndef TC_WRITE_CHUNK_SIZE
#define TC_WRITE_CHUNK_SIZE (1 << 16)
#endif

#define TC_RC_FILE_NAME ".textcoordrc"
