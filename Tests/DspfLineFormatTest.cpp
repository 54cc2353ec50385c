/*
* Copyright 2025 Rochus Keller <mailto:me@rochus-keller.ch>
*
* This file is part of the DspfEdit parser/navigator project.
*
* The following is the license that applies to this copy of the
* file. For a license to use the file under conditions
* other than those described here, please email to me@rochus-keller.ch.
*
* GNU General Public License Usage
* This file may be used under the terms of the GNU General Public
* License (GPL) versions 2.0 or 3.0 as published by the Free Software
* Foundation and appearing in the file LICENSE.GPL included in
* the packaging of this file. Please review the following information
* to ensure GNU General Public Licensing requirements will be met:
* http://www.fsf.org/licensing/licenses/info/GPLv2.html and
* http://www.gnu.org/copyleft/gpl.html.
*/

#include <QtTest>
#include <DspfLineFormat.h>
#include "DspfTestLine.h"
using namespace Dspf;

class LineFormatTest : public QObject
{
    Q_OBJECT
private slots:
    void columns()
    {
        const SourceLine line( TestLine().ind("N03").name("CUSTNO").ref().field(7, 'P', 2)
                               .usage('B').pos(10, 5).keyword("EDTCDE(Z)") );
        QVERIFY( !line.isComment() );
        QVERIFY( !line.isRecord() );
        QVERIFY( line.isReferenced() );
        QVERIFY( !line.isHidden() );
        QVERIFY( !line.continues() );
        QCOMPARE( line.indicatorSegment(), QString("N03      ") );
        QCOMPARE( line.name(), QString("CUSTNO") );
        QCOMPARE( line.lengthDigits(), QString("7") );
        QCOMPARE( line.type(), QChar('P') );
        QCOMPARE( line.decimalsDigits(), QString("2") );
        QCOMPARE( line.usage(), QChar('B') );
        QCOMPARE( int(line.row()), 10 );
        QCOMPARE( int(line.col()), 5 );
        QCOMPARE( line.keywordArea(), QString("EDTCDE(Z)") );
    }

    void recordAndComment()
    {
        const SourceLine rec( TestLine().record("CUSTREC") );
        QVERIFY( rec.isRecord() );
        QCOMPARE( rec.name(), QString("CUSTREC") );

        const SourceLine cmt( TestLine().comment("R CUSTREC") );
        QVERIFY( cmt.isComment() );
    }

    void shortLines()
    {
        const SourceLine empty( QString("12") );
        QVERIFY( empty.text().isEmpty() );
        QVERIFY( !empty.isComment() );
        QVERIFY( !empty.isRecord() );
        QVERIFY( empty.at(11).isNull() );

        const SourceLine partial( QString("00010A          R CUST") );
        QVERIFY( partial.isRecord() );
        QCOMPARE( partial.name(), QString("CUST") );
        QCOMPARE( partial.rowDigits(), QString() );
        QCOMPARE( int(partial.row()), 0 );
        QCOMPARE( partial.keywordArea(), QString() );
        QCOMPARE( partial.literalArea(), QString() );
        QVERIFY( !partial.continues() );
    }

    void toNumber()
    {
        bool ok = true;
        QCOMPARE( SourceLine::toNumber(QString(), &ok), 0 );
        QVERIFY( !ok );
        QCOMPARE( SourceLine::toNumber(" 12", &ok), 12 );
        QVERIFY( ok );
        QCOMPARE( SourceLine::toNumber("1a", &ok), 0 );
        QVERIFY( !ok );
        QCOMPARE( SourceLine::toNumber("-3", &ok), 0 );
        QVERIFY( !ok );
        QCOMPARE( SourceLine::toNumber("0", &ok), 0 );
        QVERIFY( ok );
    }

    void indicators()
    {
        const Indicators inds = LineFormatter::decodeIndicators(" 01N02   ");
        QCOMPARE( inds.size(), 2 );
        QCOMPARE( inds[0], Indicator(1, false) );
        QCOMPARE( inds[1], Indicator(2, true) );
    }

    void indicatorsSortedAndBounded()
    {
        Indicators inds = LineFormatter::decodeIndicators("N45 03 17");
        QCOMPARE( inds.size(), 3 );
        QCOMPARE( inds[0], Indicator(3, false) );
        QCOMPARE( inds[1], Indicator(17, false) );
        QCOMPARE( inds[2], Indicator(45, true) );

        inds = LineFormatter::decodeIndicators(" 00NXX 07");
        QCOMPARE( inds.size(), 1 );
        QCOMPARE( inds[0], Indicator(7, false) );

        QVERIFY( LineFormatter::decodeIndicators("         ").isEmpty() );
        QVERIFY( LineFormatter::decodeIndicators(QString()).isEmpty() );

        // duplicates are not rejected
        QCOMPARE( LineFormatter::decodeIndicators(" 05N05").size(), 2 );
    }

    void constantTwoLines()
    {
        const QString p1 = "'Customer number and";
        QStringList lines;
        lines << TestLine().pos(4, 2).keyword(p1).cont();
        lines << TestLine().keyword("name'");
        const LineFormatter::Merged m = LineFormatter::mergeConstant(lines, 0);
        QCOMPARE( m.lastLine, 1 );
        QCOMPARE( m.text, QString(p1.leftJustified(35) + "name'") );
    }

    void constantRoundTrip()
    {
        const QString p1 = "'Press Enter to continue or F3 to";
        const QString p2 = "exit the program, F12 to return";
        const QString p3 = "to the previous screen.'";
        QStringList lines;
        lines << TestLine().keyword("INFO").cont(); // unrelated preceding line
        lines << TestLine().pos(23, 2).keyword(p1).cont();
        lines << TestLine().keyword(p2).cont();
        lines << TestLine().keyword(p3);
        lines << TestLine().keyword("COLOR(WHT)");
        const LineFormatter::Merged m = LineFormatter::mergeConstant(lines, 1);
        QCOMPARE( m.lastLine, 3 );
        QCOMPARE( m.text, QString(p1.leftJustified(35) + p2.leftJustified(35) + p3) );
    }

    void constantMarkerOnLastLine()
    {
        QStringList lines;
        lines << TestLine().pos(1, 1).keyword("'Dangling'").cont();
        const LineFormatter::Merged m = LineFormatter::mergeConstant(lines, 0);
        QCOMPARE( m.lastLine, 0 );
        QCOMPARE( m.text, QString("'Dangling'") );
    }

    void keywords()
    {
        QStringList lines;
        lines << TestLine().keyword("DSPATR(HI -");
        lines << TestLine().keyword("RI)");
        lines << TestLine().keyword("COLOR(RED)");
        LineFormatter::Merged m = LineFormatter::mergeKeywords(lines, 0);
        QCOMPARE( m.lastLine, 1 );
        QCOMPARE( m.text, QString("DSPATR(HI RI)") );

        m = LineFormatter::mergeKeywords(lines, 2);
        QCOMPARE( m.lastLine, 2 );
        QCOMPARE( m.text, QString("COLOR(RED)") );
    }

    void keywordMarkerInLastColumn()
    {
        QStringList lines;
        lines << TestLine().keyword("TEXT('Order").cont();
        lines << TestLine().keyword("entry')");
        const LineFormatter::Merged m = LineFormatter::mergeKeywords(lines, 0);
        QCOMPARE( m.lastLine, 1 );
        QCOMPARE( m.text, QString(QString("TEXT('Order").leftJustified(35) + "entry')") );
    }

    void emptyKeywordArea()
    {
        QStringList lines;
        lines << TestLine().name("FLD").field(5, 'A');
        const LineFormatter::Merged m = LineFormatter::mergeKeywords(lines, 0);
        QVERIFY( m.text.isEmpty() );
        QCOMPARE( m.lastLine, 0 );
        QCOMPARE( LineFormatter::mergeKeywords(lines, 5).lastLine, -1 );
    }

    void splitLines()
    {
        const QStringList lines = LineFormatter::splitLines("a\r\nb\nc\r\n");
        QCOMPARE( lines.size(), 4 );
        QCOMPARE( lines[0], QString("a") );
        QCOMPARE( lines[1], QString("b") );
        QCOMPARE( lines[2], QString("c") );
        QVERIFY( lines[3].isEmpty() );
    }
};

QTEST_GUILESS_MAIN(LineFormatTest)

#include "DspfLineFormatTest.moc"
