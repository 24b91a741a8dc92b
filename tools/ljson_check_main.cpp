#include "ljson_check.h"

int main( int argc, char **argv )
{
	return ljson::RunCheck( argc, argv, stdout, stderr );
}
