#ifndef GRPAF_MAIN_H
#define GRPAF_MAIN_H

int grpaf_main(int argc, char* argv[]);

#endif  // GRPAF_MAIN_H
